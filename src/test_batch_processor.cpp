#include "LabelBatchProcessor.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <map>
#include <mutex>
#include <set>
#include <sstream>

using namespace labelcrop;

namespace {

const PageDimensions kSheet{300, 100};

// ---------------------------------------------------------------------------
// In-memory documents
// ---------------------------------------------------------------------------

struct FakePage {
  PageDimensions size;
  std::vector<TextFragment> words;
};

struct FakeSource {
  std::vector<FakePage> pages;
  cv::Mat raster; ///< Returned for every page
};

class FakeDocument : public DocumentAccess {
public:
  FakeDocument(std::string name, const FakeSource &source)
      : m_name(std::move(name)), m_source(source) {}

  std::string name() const override { return m_name; }

  int pageCount() const override {
    return static_cast<int>(m_source.pages.size());
  }

  PageDimensions getPageDimensions(int pageIndex) override {
    return m_source.pages.at(pageIndex).size;
  }

  std::vector<TextFragment> pageWords(int pageIndex) override {
    return m_source.pages.at(pageIndex).words;
  }

  cv::Mat getRaster(int, double) override { return m_source.raster.clone(); }

  const std::vector<char> &rawData() const override { return m_raw; }

private:
  std::string m_name;
  FakeSource m_source;
  std::vector<char> m_raw;
};

class FakeLibrary {
public:
  void add(const std::string &name, FakeSource source) {
    m_sources[name] = std::move(source);
  }

  /// Later opens of name fail, as when a file disappears mid-run
  void openOnce(const std::string &name) { m_openOnce.insert(name); }

  DocumentOpener opener() {
    return [this](const std::string &source, std::string &errorMessage)
               -> std::unique_ptr<DocumentAccess> {
      m_opens++;
      auto it = m_sources.find(source);
      if (it == m_sources.end()) {
        errorMessage = "No such document: " + source;
        return nullptr;
      }
      if (m_openOnce.count(source) > 0) {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_opened.count(source) > 0) {
          errorMessage = "Document went away: " + source;
          return nullptr;
        }
        m_opened.insert(source);
      }
      return std::make_unique<FakeDocument>(source, it->second);
    };
  }

  int opens() const { return m_opens.load(); }

private:
  std::map<std::string, FakeSource> m_sources;
  std::set<std::string> m_openOnce;
  std::set<std::string> m_opened;
  std::mutex m_mutex;
  std::atomic<int> m_opens{0};
};

// ---------------------------------------------------------------------------
// Recording compositor
// ---------------------------------------------------------------------------

struct CompositorCall {
  bool inPlace = false;
  std::string document;
  std::vector<int> pages;
  Rect clip;
  ReferenceSize outputSize;
  int copies = 0;
};

class RecordingCompositor : public LabelCompositor {
public:
  RenderResult renderCroppedPages(DocumentAccess &doc,
                                  const std::vector<int> &pages,
                                  const Rect &clip,
                                  const ReferenceSize &outputSize,
                                  int copies) override {
    return record({false, doc.name(), pages, clip, outputSize, copies});
  }

  RenderResult cropPagesInPlace(DocumentAccess &doc,
                                const std::vector<int> &pages,
                                const Rect &cropBox, int copies) override {
    return record({true, doc.name(), pages, cropBox,
                   ReferenceSize{cropBox.width(), cropBox.height()}, copies});
  }

  std::vector<CompositorCall> calls() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_calls;
  }

  const CompositorCall *callFor(const std::string &document,
                                int firstPage) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    for (const auto &call : m_calls) {
      if (call.document == document && call.pages.front() == firstPage) {
        return &call;
      }
    }
    return nullptr;
  }

  std::string failingDocument;

private:
  RenderResult record(CompositorCall call) {
    RenderResult result;
    if (call.document == failingDocument) {
      result.errorMessage = "render failed";
    } else {
      result.success = true;
      result.pageCount = static_cast<int>(call.pages.size()) * call.copies;
      result.pdfData = "%PDF-1.5 " + call.document;
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    m_calls.push_back(std::move(call));
    return result;
  }

  mutable std::mutex m_mutex;
  std::vector<CompositorCall> m_calls;
};

// ---------------------------------------------------------------------------
// Page layouts
// ---------------------------------------------------------------------------

// One hangtag column at horizontal offset ox: SKU line, price, barcode digits
void addHangtag(std::vector<TextFragment> &words, double ox,
                const std::string &sku, double barcodeWidth = 60) {
  if (sku.empty()) {
    words.push_back({Rect(ox + 10, 10, ox + 50, 20), "HANGTAG"});
  } else {
    std::istringstream parts(sku);
    std::string first, second, third;
    parts >> first >> second >> third;
    words.push_back({Rect(ox + 10, 10, ox + 40, 20), first});
    words.push_back({Rect(ox + 44, 10, ox + 60, 20), second});
    words.push_back({Rect(ox + 64, 10, ox + 80, 20), third});
  }
  words.push_back({Rect(ox + 10, 40, ox + 35, 50), "$19.990"});
  words.push_back(
      {Rect(ox + 15, 60, ox + 15 + barcodeWidth, 70), "7801234567890"});
}

// Sheet of three hangtags; only the leftmost one identifies the page
FakePage sheet(const std::string &leftSku, double barcodeWidth = 60) {
  FakePage page;
  page.size = kSheet;
  addHangtag(page.words, 0, leftSku, barcodeWidth);
  addHangtag(page.words, 100, "Z99999 0000 0001");
  addHangtag(page.words, 200, "Z88888 0000 0002");
  return page;
}

FakePage cartonPage(const std::string &reference) {
  FakePage page;
  page.size = PageDimensions{300, 200};
  page.words.push_back({Rect(10, 10, 60, 20), "REFERENCIA:"});
  page.words.push_back({Rect(64, 10, 90, 20), reference});
  return page;
}

cv::Mat cartonRaster() {
  // Zoom 2 raster of a 300 x 200 page
  cv::Mat raster(400, 600, CV_8UC3, cv::Scalar(255, 255, 255));
  raster(cv::Rect(100, 100, 300, 100)).setTo(cv::Scalar(0, 0, 0));
  return raster;
}

LabelCropConfig inMemoryConfig() {
  LabelCropConfig config;
  config.outputDir.clear();
  return config;
}

const LabelPlan *planFor(const BatchResult &result, const std::string &key) {
  for (const auto &label : result.labels) {
    if (label.group.key == key) {
      return &label;
    }
  }
  return nullptr;
}

} // namespace

// ---------------------------------------------------------------------------
// Text column detection
// ---------------------------------------------------------------------------

TEST(LabelBatchProcessor, GroupsLabelsAcrossDocuments) {
  FakeLibrary library;
  library.add("a.pdf", {{sheet("A00001 0001 0001"), sheet("B00002 0002 0002"),
                         sheet("A00001 0001 0001"), sheet("")},
                        cv::Mat()});
  library.add("b.pdf",
              {{sheet("C00003 0003 0003"), sheet("B00002 0002 0002")},
               cv::Mat()});
  auto compositor = std::make_shared<RecordingCompositor>();

  LabelBatchProcessor processor(inMemoryConfig(), library.opener(), compositor);
  BatchResult result = processor.process({"a.pdf", "b.pdf"});

  ASSERT_TRUE(result.success);
  EXPECT_TRUE(result.failures.empty());
  EXPECT_EQ(result.documentCount, 2);
  EXPECT_EQ(result.pagesScanned, 6);
  EXPECT_EQ(result.pagesWithoutIdentifier, 1);
  EXPECT_EQ(result.duplicatePages, 2);

  ASSERT_EQ(result.labels.size(), 3u);
  EXPECT_EQ(result.labels[0].group.key, "A00001 0001 0001");
  EXPECT_EQ(result.labels[1].group.key, "B00002 0002 0002");
  EXPECT_EQ(result.labels[2].group.key, "C00003 0003 0003");

  const Group &a = result.labels[0].group;
  EXPECT_EQ(a.documentIndex, 0);
  EXPECT_EQ(a.pageIndices, (std::vector<int>{0, 2}));
  EXPECT_EQ(result.labels[0].source, "a.pdf");
  EXPECT_EQ(result.labels[1].group.droppedDuplicates, 1);
  EXPECT_EQ(result.labels[2].source, "b.pdf");

  ASSERT_EQ(result.outputs.size(), 3u);
  for (const auto &output : result.outputs) {
    EXPECT_TRUE(output.success) << output.errorMessage;
    EXPECT_FALSE(output.pdfData.empty());
    EXPECT_TRUE(output.filePath.empty());
    EXPECT_EQ(output.pageCount, 1);
  }
  EXPECT_EQ(result.outputs[0].fileName,
            "CHILE BARCODE HANGTAG A00001 0001 0001.pdf");

  // FirstOnly: one rendered page per identifier, from its first occurrence
  EXPECT_EQ(compositor->calls().size(), 3u);
  const CompositorCall *callA = compositor->callFor("a.pdf", 0);
  ASSERT_NE(callA, nullptr);
  EXPECT_EQ(callA->pages, (std::vector<int>{0}));
  EXPECT_FALSE(callA->inPlace);
}

TEST(LabelBatchProcessor, FixedReferenceCentersOnBarcode) {
  FakeLibrary library;
  library.add("a.pdf", {{sheet("A00001 0001 0001")}, cv::Mat()});
  auto compositor = std::make_shared<RecordingCompositor>();
  LabelCropConfig config = inMemoryConfig();

  LabelBatchProcessor processor(config, library.opener(), compositor);
  BatchResult result = processor.process({"a.pdf"});

  ASSERT_EQ(result.labels.size(), 1u);
  const LabelPlan &plan = result.labels[0];
  EXPECT_TRUE(plan.anchored);
  EXPECT_EQ(plan.detectedRegion, Rect(5, 2, 85, 78));

  // Barcode digits span x 15..75
  const Rect &crop = plan.group.sharedRect;
  EXPECT_NEAR(crop.centerX(), 45.0, 1e-9);
  EXPECT_DOUBLE_EQ(crop.y0, 2.0);
  EXPECT_NEAR(crop.width(), config.referenceWidth, 1e-9);
  EXPECT_NEAR(crop.height(), config.referenceHeight, 1e-9);

  ASSERT_EQ(result.outputs.size(), 1u);
  EXPECT_DOUBLE_EQ(result.outputs[0].outputSize.width, config.referenceWidth);
  EXPECT_DOUBLE_EQ(result.outputs[0].outputSize.height,
                   config.referenceHeight);
}

TEST(LabelBatchProcessor, FirstLabelFixesSizeForParallelRender) {
  FakeLibrary library;
  std::vector<std::string> sources;
  for (int i = 0; i < 8; i++) {
    std::string name = "sheet" + std::to_string(i) + ".pdf";
    std::string sku = "A0000" + std::to_string(i) + " 0001 0001";
    // Later documents carry wider labels
    library.add(name, {{sheet(sku, i == 0 ? 60 : 70)}, cv::Mat()});
    sources.push_back(name);
  }
  auto compositor = std::make_shared<RecordingCompositor>();

  LabelCropConfig config = inMemoryConfig();
  config.sizePolicy = SizePolicy::FirstSeen;
  config.threads = 4;

  LabelBatchProcessor processor(config, library.opener(), compositor);
  BatchResult result = processor.process(sources);

  ASSERT_TRUE(result.referenceSize.has_value());
  EXPECT_EQ(*result.referenceSize, (ReferenceSize{80, 76}));

  ASSERT_EQ(result.labels.size(), 8u);
  EXPECT_EQ(result.labels[1].group.sharedRect, Rect(5, 2, 90, 78));

  ASSERT_EQ(result.outputs.size(), 8u);
  for (const auto &output : result.outputs) {
    EXPECT_TRUE(output.success) << output.errorMessage;
    EXPECT_EQ(output.outputSize, (ReferenceSize{80, 76})) << output.key;
  }
  for (const auto &call : compositor->calls()) {
    EXPECT_EQ(call.outputSize, (ReferenceSize{80, 76})) << call.document;
  }
}

TEST(LabelBatchProcessor, KeepAllPagesRendersEveryOccurrence) {
  FakeLibrary library;
  library.add("a.pdf", {{sheet("A00001 0001 0001"), sheet("B00002 0002 0002"),
                         sheet("A00001 0001 0001")},
                        cv::Mat()});
  auto compositor = std::make_shared<RecordingCompositor>();

  LabelCropConfig config = inMemoryConfig();
  config.duplicates = DuplicatePolicy::KeepAllPages;
  config.copies = 2;

  LabelBatchProcessor processor(config, library.opener(), compositor);
  BatchResult result = processor.process({"a.pdf"});

  const CompositorCall *call = compositor->callFor("a.pdf", 0);
  ASSERT_NE(call, nullptr);
  EXPECT_EQ(call->pages, (std::vector<int>{0, 2}));
  EXPECT_EQ(call->copies, 2);
  EXPECT_EQ(result.outputs[0].pageCount, 4);
}

// ---------------------------------------------------------------------------
// Failures and cancellation
// ---------------------------------------------------------------------------

TEST(LabelBatchProcessor, BadDocumentsDoNotStopTheBatch) {
  FakeLibrary library;
  library.add("empty.pdf", {{}, cv::Mat()});
  library.add("a.pdf", {{sheet("A00001 0001 0001")}, cv::Mat()});
  auto compositor = std::make_shared<RecordingCompositor>();

  LabelBatchProcessor processor(inMemoryConfig(), library.opener(), compositor);
  BatchResult result = processor.process({"missing.pdf", "empty.pdf", "a.pdf"});

  EXPECT_TRUE(result.success);
  EXPECT_EQ(result.documentCount, 1);
  ASSERT_EQ(result.failures.size(), 2u);
  EXPECT_EQ(result.failures[0].source, "missing.pdf");
  EXPECT_EQ(result.failures[0].message, "No such document: missing.pdf");
  EXPECT_EQ(result.failures[1].source, "empty.pdf");

  ASSERT_EQ(result.labels.size(), 1u);
  EXPECT_EQ(result.labels[0].group.documentIndex, 2);
  ASSERT_EQ(result.outputs.size(), 1u);
  EXPECT_TRUE(result.outputs[0].success);
}

TEST(LabelBatchProcessor, NothingUsableIsAFailure) {
  FakeLibrary library;
  auto compositor = std::make_shared<RecordingCompositor>();

  LabelBatchProcessor processor(inMemoryConfig(), library.opener(), compositor);
  BatchResult result = processor.process({"missing.pdf"});

  EXPECT_FALSE(result.success);
  EXPECT_TRUE(result.labels.empty());
  EXPECT_EQ(result.failures.size(), 1u);
}

TEST(LabelBatchProcessor, RenderFailureIsReportedPerLabel) {
  FakeLibrary library;
  library.add("a.pdf", {{sheet("A00001 0001 0001")}, cv::Mat()});
  library.add("bad.pdf", {{sheet("B00002 0002 0002")}, cv::Mat()});
  auto compositor = std::make_shared<RecordingCompositor>();
  compositor->failingDocument = "bad.pdf";

  LabelBatchProcessor processor(inMemoryConfig(), library.opener(), compositor);
  BatchResult result = processor.process({"a.pdf", "bad.pdf"});

  EXPECT_TRUE(result.success);
  ASSERT_EQ(result.outputs.size(), 2u);
  EXPECT_TRUE(result.outputs[0].success);
  EXPECT_FALSE(result.outputs[1].success);
  EXPECT_EQ(result.outputs[1].errorMessage, "render failed");
  EXPECT_EQ(result.outputs[1].key, "B00002 0002 0002");
}

TEST(LabelBatchProcessor, ReopenFailureIsListedOnce) {
  FakeLibrary library;
  library.add("a.pdf", {{sheet("A00001 0001 0001")}, cv::Mat()});
  library.add("gone.pdf", {{sheet("B00002 0002 0002"),
                            sheet("C00003 0003 0003")},
                           cv::Mat()});
  library.openOnce("gone.pdf");
  auto compositor = std::make_shared<RecordingCompositor>();

  LabelCropConfig config = inMemoryConfig();
  config.threads = 2;
  LabelBatchProcessor processor(config, library.opener(), compositor);
  BatchResult result = processor.process({"a.pdf", "gone.pdf"});

  EXPECT_TRUE(result.success);
  EXPECT_EQ(result.documentCount, 2);
  ASSERT_EQ(result.failures.size(), 1u);
  EXPECT_EQ(result.failures[0].source, "gone.pdf");
  EXPECT_EQ(result.failures[0].message, "Document went away: gone.pdf");

  ASSERT_EQ(result.outputs.size(), 3u);
  EXPECT_TRUE(result.outputs[0].success);
  EXPECT_FALSE(result.outputs[1].success);
  EXPECT_FALSE(result.outputs[2].success);
  EXPECT_EQ(result.outputs[1].errorMessage, "Document went away: gone.pdf");
  EXPECT_EQ(result.outputs[2].errorMessage, "Document went away: gone.pdf");
}

TEST(LabelBatchProcessor, CancelledBeforeStart) {
  FakeLibrary library;
  library.add("a.pdf", {{sheet("A00001 0001 0001")}, cv::Mat()});
  auto compositor = std::make_shared<RecordingCompositor>();
  std::atomic<bool> cancel{true};

  LabelBatchProcessor processor(inMemoryConfig(), library.opener(), compositor);
  BatchResult result = processor.process({"a.pdf"}, &cancel);

  EXPECT_TRUE(result.cancelled);
  EXPECT_TRUE(result.labels.empty());
  EXPECT_TRUE(result.outputs.empty());
  EXPECT_TRUE(compositor->calls().empty());
  EXPECT_EQ(library.opens(), 0);
}

TEST(LabelBatchProcessor, AnalyzeDoesNotRender) {
  FakeLibrary library;
  library.add("a.pdf", {{sheet("A00001 0001 0001")}, cv::Mat()});
  auto compositor = std::make_shared<RecordingCompositor>();

  LabelBatchProcessor processor(inMemoryConfig(), library.opener(), compositor);
  BatchResult result = processor.analyze({"a.pdf"});

  EXPECT_TRUE(result.success);
  EXPECT_EQ(result.labels.size(), 1u);
  EXPECT_TRUE(result.outputs.empty());
  EXPECT_TRUE(compositor->calls().empty());
}

TEST(LabelBatchProcessor, WritesOutputFiles) {
  namespace fs = std::filesystem;
  fs::path dir = fs::temp_directory_path() / "labelcrop_batch_output";
  fs::remove_all(dir);

  FakeLibrary library;
  library.add("a.pdf", {{sheet("A00001 0001 0001")}, cv::Mat()});
  auto compositor = std::make_shared<RecordingCompositor>();

  LabelCropConfig config;
  config.outputDir = dir.string();
  config.outputPrefix = "TAG";

  LabelBatchProcessor processor(config, library.opener(), compositor);
  BatchResult result = processor.process({"a.pdf"});

  ASSERT_EQ(result.outputs.size(), 1u);
  const LabelOutput &output = result.outputs[0];
  ASSERT_TRUE(output.success) << output.errorMessage;
  EXPECT_EQ(output.filePath, (dir / "TAG A00001 0001 0001.pdf").string());
  EXPECT_TRUE(fs::exists(output.filePath));
  EXPECT_TRUE(output.pdfData.empty());
  EXPECT_GT(fs::file_size(output.filePath), 0u);

  fs::remove_all(dir);
}

// ---------------------------------------------------------------------------
// Content mask detection
// ---------------------------------------------------------------------------

TEST(LabelBatchProcessor, MaskModeSharesOneRectPerDocument) {
  FakeLibrary library;
  library.add("picking.pdf", {{cartonPage("R1"), cartonPage("R1"),
                               cartonPage("R2"), cartonPage("R1")},
                              cartonRaster()});
  auto compositor = std::make_shared<RecordingCompositor>();

  LabelCropConfig config = inMemoryConfig();
  config.detection = DetectionStrategy::ContentMask;
  config.grammar = IdentifierGrammar::Referencia;
  config.sizePolicy = SizePolicy::None;
  config.duplicates = DuplicatePolicy::KeepAllPages;
  config.outputPrefix = "CARTON BARCODE -";

  LabelBatchProcessor processor(config, library.opener(), compositor);
  BatchResult result = processor.process({"picking.pdf"});

  ASSERT_EQ(result.labels.size(), 2u);
  const LabelPlan *r1 = planFor(result, "R1");
  const LabelPlan *r2 = planFor(result, "R2");
  ASSERT_NE(r1, nullptr);
  ASSERT_NE(r2, nullptr);
  EXPECT_EQ(r1->group.pageIndices, (std::vector<int>{0, 1, 3}));
  EXPECT_EQ(r2->group.pageIndices, (std::vector<int>{2}));
  EXPECT_EQ(r1->group.sharedRect, r2->group.sharedRect);
  EXPECT_EQ(r1->group.sharedRect, r1->detectedRegion);

  // Content spans pixels 100..399 x 100..199, half that in page units
  const Rect &rect = r1->group.sharedRect;
  EXPECT_DOUBLE_EQ(rect.x0, 50.0);
  EXPECT_DOUBLE_EQ(rect.x1, 199.5);
  EXPECT_NEAR(rect.width() / rect.height(), config.targetAspectRatio, 1e-9);

  auto calls = compositor->calls();
  ASSERT_EQ(calls.size(), 2u);
  for (const auto &call : calls) {
    EXPECT_TRUE(call.inPlace);
    EXPECT_EQ(call.clip, rect);
  }
  const CompositorCall *callR1 = compositor->callFor("picking.pdf", 0);
  ASSERT_NE(callR1, nullptr);
  EXPECT_EQ(callR1->pages, (std::vector<int>{0, 1, 3}));

  EXPECT_EQ(result.outputs[0].fileName, "CARTON BARCODE - R1.pdf");
}

TEST(LabelBatchProcessor, MaskModeWritesPreview) {
  namespace fs = std::filesystem;
  fs::path preview = fs::temp_directory_path() / "labelcrop_preview.png";
  fs::remove(preview);

  FakeLibrary library;
  library.add("picking.pdf", {{cartonPage("R1")}, cartonRaster()});
  auto compositor = std::make_shared<RecordingCompositor>();

  LabelCropConfig config = inMemoryConfig();
  config.detection = DetectionStrategy::ContentMask;
  config.grammar = IdentifierGrammar::Referencia;
  config.previewPath = preview.string();

  LabelBatchProcessor processor(config, library.opener(), compositor);
  BatchResult result = processor.analyze({"picking.pdf"});

  EXPECT_EQ(result.previewPath, preview.string());
  cv::Mat written = cv::imread(preview.string());
  EXPECT_EQ(written.cols, config.previewWidth);
  EXPECT_EQ(written.rows, config.previewHeight);

  fs::remove(preview);
}

TEST(LabelBatchProcessor, MaskModeNeedsARaster) {
  FakeLibrary library;
  library.add("picking.pdf", {{cartonPage("R1")}, cv::Mat()});
  auto compositor = std::make_shared<RecordingCompositor>();

  LabelCropConfig config = inMemoryConfig();
  config.detection = DetectionStrategy::ContentMask;
  config.grammar = IdentifierGrammar::Referencia;

  LabelBatchProcessor processor(config, library.opener(), compositor);
  BatchResult result = processor.process({"picking.pdf"});

  EXPECT_FALSE(result.success);
  ASSERT_EQ(result.failures.size(), 1u);
  EXPECT_TRUE(result.labels.empty());
}
