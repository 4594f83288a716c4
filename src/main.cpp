#include "LabelBatchProcessor.hpp"
#include "PDFDocumentAccess.hpp"

#include <atomic>
#include <csignal>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace {

std::atomic<bool> g_cancel{false};

void handleInterrupt(int) { g_cancel.store(true); }

void printUsage(const char *programName) {
  std::cout
      << "Usage: " << programName << " [options] <pdf_file>...\n"
      << "\nDetection:\n"
      << "  -m, --mode <columns|mask>     Label detection (default: columns)\n"
      << "  -g, --grammar <sku|referencia> Identifier format (default: sku)\n"
      << "  -c, --columns <n>             Labels across a page (default: 3)\n"
      << "      --pad-x <n>               Horizontal padding (default: 5)\n"
      << "      --pad-y <n>               Vertical padding (default: 8)\n"
      << "      --min-digits <n>          Barcode digit minimum (default: 8)\n"
      << "      --ratio <w/h>             Mask crop aspect ratio (default: "
         "680/480)\n"
      << "      --threshold <0-255>       Mask intensity threshold (default: "
         "250)\n"
      << "      --zoom <f>                Mask raster zoom (default: 2)\n"
      << "\nOutput:\n"
      << "  -s, --size <fixed|first|none> Output size policy (default: "
         "fixed)\n"
      << "      --ref-size <w> <h>        Fixed reference size in points\n"
      << "  -d, --duplicates <first|all>  Pages per identifier (default: "
         "first)\n"
      << "      --copies <n>              Copies of each page (default: 1)\n"
      << "  -p, --prefix <text>           File name prefix\n"
      << "  -o, --output <dir>            Output directory (default: labels)\n"
      << "      --preview <png>           Write crop preview (mask mode)\n"
      << "  -n, --dry-run                 Only list the labels found\n"
      << "\nText:\n"
      << "      --ocr                     OCR pages without a text layer\n"
      << "      --tessdata <path>         Tesseract data directory\n"
      << "  -l, --language <lang>         OCR language (default: eng)\n"
      << "\nGeneral:\n"
      << "  -j, --threads <n>             Render threads (default: all)\n"
      << "  -v, --verbose                 Print debug output\n"
      << "  -h, --help                    Show this help message\n"
      << "\nExamples:\n"
      << "  " << programName << " hangtags.pdf\n"
      << "  " << programName
      << " -m mask -g referencia -s none -d all -p \"CARTON BARCODE -\" "
         "picking.pdf\n";
}

bool parseRatio(const std::string &text, double &ratio) {
  try {
    size_t slash = text.find('/');
    if (slash == std::string::npos) {
      ratio = std::stod(text);
    } else {
      double numerator = std::stod(text.substr(0, slash));
      double denominator = std::stod(text.substr(slash + 1));
      if (denominator == 0.0) {
        return false;
      }
      ratio = numerator / denominator;
    }
    return true;
  } catch (const std::exception &) {
    return false;
  }
}

} // namespace

int main(int argc, char *argv[]) {
  if (argc < 2) {
    printUsage(argv[0]);
    return 1;
  }

  labelcrop::LabelCropConfig config;
  std::vector<std::string> inputs;
  bool dryRun = false;

  auto needValue = [&](int i, const std::string &arg, int count = 1) {
    if (i + count < argc) {
      return true;
    }
    std::cerr << "Error: " << arg << " requires an argument\n";
    return false;
  };

  // Parse command line arguments
  try {
    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];

      if (arg == "-h" || arg == "--help") {
        printUsage(argv[0]);
        return 0;
      } else if (arg == "-m" || arg == "--mode") {
        if (!needValue(i, arg))
          return 1;
        auto mode = labelcrop::detectionFromName(argv[++i]);
        if (!mode) {
          std::cerr << "Error: unknown mode: " << argv[i] << "\n";
          return 1;
        }
        config.detection = *mode;
      } else if (arg == "-g" || arg == "--grammar") {
        if (!needValue(i, arg))
          return 1;
        auto grammar = labelcrop::grammarFromName(argv[++i]);
        if (!grammar) {
          std::cerr << "Error: unknown grammar: " << argv[i] << "\n";
          return 1;
        }
        config.grammar = *grammar;
      } else if (arg == "-s" || arg == "--size") {
        if (!needValue(i, arg))
          return 1;
        auto policy = labelcrop::sizePolicyFromName(argv[++i]);
        if (!policy) {
          std::cerr << "Error: unknown size policy: " << argv[i] << "\n";
          return 1;
        }
        config.sizePolicy = *policy;
      } else if (arg == "-d" || arg == "--duplicates") {
        if (!needValue(i, arg))
          return 1;
        auto policy = labelcrop::duplicatePolicyFromName(argv[++i]);
        if (!policy) {
          std::cerr << "Error: unknown duplicate policy: " << argv[i] << "\n";
          return 1;
        }
        config.duplicates = *policy;
      } else if (arg == "-c" || arg == "--columns") {
        if (!needValue(i, arg))
          return 1;
        config.columns = std::stoi(argv[++i]);
      } else if (arg == "--pad-x") {
        if (!needValue(i, arg))
          return 1;
        config.paddingX = std::stoi(argv[++i]);
      } else if (arg == "--pad-y") {
        if (!needValue(i, arg))
          return 1;
        config.paddingY = std::stoi(argv[++i]);
      } else if (arg == "--min-digits") {
        if (!needValue(i, arg))
          return 1;
        config.minBarcodeDigits = std::stoi(argv[++i]);
      } else if (arg == "--ratio") {
        if (!needValue(i, arg))
          return 1;
        if (!parseRatio(argv[++i], config.targetAspectRatio)) {
          std::cerr << "Error: invalid ratio: " << argv[i] << "\n";
          return 1;
        }
      } else if (arg == "--threshold") {
        if (!needValue(i, arg))
          return 1;
        config.intensityThreshold = std::stoi(argv[++i]);
      } else if (arg == "--zoom") {
        if (!needValue(i, arg))
          return 1;
        config.rasterZoom = std::stod(argv[++i]);
      } else if (arg == "--ref-size") {
        if (!needValue(i, arg, 2))
          return 1;
        config.referenceWidth = std::stod(argv[++i]);
        config.referenceHeight = std::stod(argv[++i]);
      } else if (arg == "--copies") {
        if (!needValue(i, arg))
          return 1;
        config.copies = std::stoi(argv[++i]);
      } else if (arg == "-p" || arg == "--prefix") {
        if (!needValue(i, arg))
          return 1;
        config.outputPrefix = argv[++i];
      } else if (arg == "-o" || arg == "--output") {
        if (!needValue(i, arg))
          return 1;
        config.outputDir = argv[++i];
      } else if (arg == "--preview") {
        if (!needValue(i, arg))
          return 1;
        config.previewPath = argv[++i];
      } else if (arg == "-n" || arg == "--dry-run") {
        dryRun = true;
      } else if (arg == "--ocr") {
        config.ocrFallback = true;
      } else if (arg == "--tessdata") {
        if (!needValue(i, arg))
          return 1;
        config.tessDataPath = argv[++i];
      } else if (arg == "-l" || arg == "--language") {
        if (!needValue(i, arg))
          return 1;
        config.language = argv[++i];
      } else if (arg == "-j" || arg == "--threads") {
        if (!needValue(i, arg))
          return 1;
        config.threads = std::stoi(argv[++i]);
      } else if (arg == "-v" || arg == "--verbose") {
        config.verbose = true;
      } else if (arg[0] != '-') {
        inputs.push_back(arg);
      } else {
        std::cerr << "Unknown option: " << arg << "\n";
        printUsage(argv[0]);
        return 1;
      }
    }
  } catch (const std::exception &e) {
    std::cerr << "Error: invalid numeric argument (" << e.what() << ")\n";
    return 1;
  }

  if (inputs.empty()) {
    std::cerr << "Error: No PDF files provided\n";
    printUsage(argv[0]);
    return 1;
  }

  if (auto error = labelcrop::validateConfig(config)) {
    std::cerr << "Error: " << *error << "\n";
    return 1;
  }

  std::cout << "=== Label Crop ===\n"
            << "Mode: " << labelcrop::detectionName(config.detection)
            << ", grammar: " << labelcrop::grammarName(config.grammar)
            << ", size: " << labelcrop::sizePolicyName(config.sizePolicy)
            << ", duplicates: "
            << labelcrop::duplicatePolicyName(config.duplicates) << "\n"
            << "Documents: " << inputs.size() << "\n"
            << "==================\n\n";

  labelcrop::OcrOptions ocr;
  ocr.enabled = config.ocrFallback;
  ocr.tessDataPath = config.tessDataPath;
  ocr.language = config.language;

  labelcrop::LabelBatchProcessor processor(
      config, labelcrop::PDFDocumentAccess::opener(ocr),
      std::make_shared<labelcrop::PDFLabelRenderer>());

  std::signal(SIGINT, handleInterrupt);

  labelcrop::BatchResult result = dryRun ? processor.analyze(inputs, &g_cancel)
                                         : processor.process(inputs, &g_cancel);

  // Display results
  std::cout << "[Labels]\n";
  std::cout << std::setw(4) << "No." << "  " << std::left << std::setw(22)
            << "Identifier" << std::setw(8) << "Pages" << std::setw(10)
            << "Barcode" << "Source" << std::right << "\n";
  std::cout << std::string(80, '-') << "\n";

  for (size_t i = 0; i < result.labels.size(); ++i) {
    const auto &label = result.labels[i];
    std::cout << std::setw(4) << (i + 1) << "  " << std::left << std::setw(22)
              << label.group.key << std::setw(8)
              << label.group.pageIndices.size() << std::setw(10)
              << (label.anchored ? "yes" : "no") << label.source << std::right
              << "\n";
  }

  if (!result.outputs.empty()) {
    std::cout << "\n[Outputs]\n";
    for (const auto &output : result.outputs) {
      if (output.success) {
        std::cout << "  " << output.filePath << " (" << output.pageCount
                  << " page" << (output.pageCount == 1 ? "" : "s") << ", "
                  << std::fixed << std::setprecision(2)
                  << output.outputSize.width << " x "
                  << output.outputSize.height << " pt)\n";
      } else {
        std::cout << "  FAILED " << output.fileName << ": "
                  << output.errorMessage << "\n";
      }
    }
  }

  if (!result.failures.empty()) {
    std::cout << "\n[Failed documents]\n";
    for (const auto &failure : result.failures) {
      std::cout << "  " << failure.source << ": " << failure.message << "\n";
    }
  }

  std::cout << "\nDocuments processed: " << result.documentCount << "/"
            << inputs.size() << "\n"
            << "Pages scanned: " << result.pagesScanned
            << ", without identifier: " << result.pagesWithoutIdentifier
            << ", duplicates: " << result.duplicatePages << "\n";
  if (result.referenceSize) {
    std::cout << "Reference size: " << std::fixed << std::setprecision(2)
              << result.referenceSize->width << " x "
              << result.referenceSize->height << " pt\n";
  }
  if (result.cancelled) {
    std::cout << "Run cancelled, results are partial\n";
  }
  std::cout << "Processing time: " << std::fixed << std::setprecision(2)
            << result.processingTimeMs << " ms\n";

  if (result.labels.empty()) {
    std::cerr << "No labels with recognizable identifiers were found.\n";
  }

  return result.success ? 0 : 1;
}
