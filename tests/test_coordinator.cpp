#include <iostream>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <memory>
#include <set>
#include <sstream>
#include <string>
#include <thread>
#include <vector>
#include <stdexcept>

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <pugixml.hpp>
#include <zip.h>

#include "../src/job/coordinator.hpp"
#include "../src/package/format_converter.hpp"
#include "../src/source/page_source.hpp"
#include "../src/transform/upscaler.hpp"
#include "../src/util/subprocess.hpp"
#include "../src/util/log.hpp"
#include "../src/util/text.hpp"

using namespace panelpress;
namespace fs = std::filesystem;

#define TEST(name) static void test_##name()
#define RUN_TEST(name) do { \
    std::cout << "Running " #name "... "; \
    try { \
        test_##name(); \
        std::cout << "PASSED\n"; \
    } catch (const std::exception& e) { \
        std::cout << "FAILED: " << e.what() << "\n"; \
        failures++; \
    } catch (...) { \
        std::cout << "FAILED: unknown exception\n"; \
        failures++; \
    } \
} while(0)

int failures = 0;

static fs::path output_root() {
    return fs::temp_directory_path() / "panelpress_coordinator_test";
}

static std::vector<uint8_t> flat_page(int w, int h, int shade) {
    cv::Mat img(h, w, CV_8UC3, cv::Scalar(shade, shade, shade));
    std::vector<uint8_t> out;
    cv::imencode(".jpg", img, out);
    return out;
}

static std::vector<uint8_t> noise_page(int w, int h) {
    cv::Mat img(h, w, CV_8UC3);
    cv::randu(img, cv::Scalar::all(0), cv::Scalar::all(255));
    std::vector<uint8_t> out;
    cv::imencode(".jpg", img, out, {cv::IMWRITE_JPEG_QUALITY, 85});
    return out;
}

static SourceDocument make_doc(const std::string& id, std::vector<std::vector<uint8_t>> images) {
    SourceDocument doc;
    doc.id = id;
    doc.name = id;
    for (size_t i = 0; i < images.size(); ++i) {
        RawPage p;
        p.name = "p" + std::to_string(i) + ".jpg";
        p.bytes = std::move(images[i]);
        doc.pages.push_back(std::move(p));
    }
    return doc;
}

class FailingConverter : public FormatConverter {
public:
    Result convert(const std::string&, const std::string&, const std::atomic<bool>&) const override {
        return Result::fail(ErrorCode::EXTERNAL_TOOL_ERROR, "converter exited with status 1");
    }
    const char* name() const override { return "failing"; }
};

class CopyConverter : public FormatConverter {
public:
    Result convert(const std::string& primary, const std::string& legacy, const std::atomic<bool>&) const override {
        std::error_code ec;
        fs::copy_file(primary, legacy, fs::copy_options::overwrite_existing, ec);
        if (ec) return Result::fail(ErrorCode::IO_ERROR, ec.message());
        return Result::ok();
    }
    const char* name() const override { return "copy"; }
};

static JobCoordinator::Config coordinator_config() {
    JobCoordinator::Config cfg;
    cfg.output_dir = output_root().string();
    cfg.workers = 2;
    return cfg;
}

static ConversionRequest request_for(const std::string& session, std::vector<std::string> ids) {
    ConversionRequest req;
    req.session_id = session;
    req.source_ids = std::move(ids);
    req.metadata.title = "Test Book";
    req.metadata.series = "Test Series";
    req.transform.target_width = 300;
    req.transform.target_height = 400;
    return req;
}

// Polls until terminal; progress seen by a client must never go backwards.
static ConversionJob wait_for(const JobCoordinator& coord, const std::string& id) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(120);
    double last_progress = 0.0;
    while (std::chrono::steady_clock::now() < deadline) {
        auto job = coord.status(id);
        assert(job);
        assert(job->progress >= last_progress);
        last_progress = job->progress;
        if (job->terminal()) {
            if (job->phase == JobPhase::Completed) assert(job->progress == 100.0);
            return *job;
        }
        assert(job->progress <= 99.0);
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    throw std::runtime_error("job did not finish: " + id);
}

static std::string read_entry(const std::string& archive, const std::string& name) {
    int err = 0;
    zip_t* za = zip_open(archive.c_str(), ZIP_RDONLY, &err);
    if (!za) throw std::runtime_error("cannot open " + archive);
    zip_stat_t st;
    zip_stat_init(&st);
    if (zip_stat(za, name.c_str(), 0, &st) != 0) {
        zip_discard(za);
        throw std::runtime_error("missing entry " + name);
    }
    std::string out(static_cast<size_t>(st.size), '\0');
    zip_file_t* f = zip_fopen(za, name.c_str(), 0);
    zip_int64_t n = f ? zip_fread(f, out.data(), st.size) : -1;
    if (f) zip_fclose(f);
    zip_discard(za);
    if (n != static_cast<zip_int64_t>(st.size)) throw std::runtime_error("short read of " + name);
    return out;
}

static std::string book_title(const std::string& epub) {
    std::string opf = read_entry(epub, "OEBPS/content.opf");
    pugi::xml_document doc;
    assert(doc.load_string(opf.c_str()));
    return doc.child("package").child("metadata").child("dc:title").text().get();
}

static double mean_shade(const std::string& bytes) {
    std::vector<uint8_t> buf(bytes.begin(), bytes.end());
    cv::Mat img = cv::imdecode(buf, cv::IMREAD_GRAYSCALE);
    assert(!img.empty());
    return cv::mean(img)[0];
}

static bool looks_like_epub(const std::string& path) {
    std::vector<uint8_t> bytes;
    if (!read_file(path, bytes) || bytes.size() < 200) return false;
    if (bytes[0] != 'P' || bytes[1] != 'K') return false;
    std::string head(bytes.begin(), bytes.begin() + 200);
    return head.substr(30, 8) == "mimetype" && head.find("application/epub+zip") != std::string::npos;
}

TEST(single_document_to_epub) {
    auto sources = std::make_shared<MemorySourceProvider>();
    sources->add("s1", make_doc("ch1", {flat_page(600, 800, 40), flat_page(600, 800, 120), flat_page(1200, 800, 200)}));
    JobCoordinator coord(coordinator_config(), sources, std::make_shared<DisabledConverter>());

    auto submitted = coord.submit(request_for("s1", {"ch1"}));
    assert(submitted.result.success());
    assert(submitted.job.id.size() == 32);

    ConversionJob job = wait_for(coord, submitted.job.id);
    assert(job.phase == JobPhase::Completed);
    assert(job.progress == 100.0);
    assert(!job.current_file);
    assert(job.volume_count == 1);
    assert(job.output_files.size() == 1);
    assert(job.output_files[0] == "Test Series - Chapter 001.epub");

    auto path = coord.artifact_path(job.id, job.output_files[0]);
    assert(path);
    assert(looks_like_epub(*path));
    assert(!coord.artifact_path(job.id, "../escape.epub"));

    auto outs = coord.outputs(job.id);
    assert(outs && outs->size() == 1);
    assert(coord.delete_session("s1").success());
}

TEST(failed_legacy_conversion_keeps_epub) {
    auto sources = std::make_shared<MemorySourceProvider>();
    sources->add("s2", make_doc("ch1", {flat_page(300, 400, 90)}));
    JobCoordinator coord(coordinator_config(), sources, std::make_shared<FailingConverter>());

    ConversionRequest req = request_for("s2", {"ch1"});
    req.format = OutputFormat::Both;
    auto submitted = coord.submit(req);
    assert(submitted.result.success());

    ConversionJob job = wait_for(coord, submitted.job.id);
    assert(job.phase == JobPhase::Completed);
    assert(job.output_files.size() == 1);
    assert(iends_with(job.output_files[0], ".epub"));
    assert(!job.warnings.empty());
    assert(coord.delete_session("s2").success());
}

TEST(legacy_only_output_replaces_epub) {
    auto sources = std::make_shared<MemorySourceProvider>();
    sources->add("s3", make_doc("ch1", {flat_page(300, 400, 90)}));
    JobCoordinator coord(coordinator_config(), sources, std::make_shared<CopyConverter>());

    ConversionRequest req = request_for("s3", {"ch1"});
    req.format = OutputFormat::Legacy;
    auto submitted = coord.submit(req);
    ConversionJob job = wait_for(coord, submitted.job.id);
    assert(job.phase == JobPhase::Completed);
    assert(job.output_files.size() == 1);
    assert(iends_with(job.output_files[0], ".mobi"));

    fs::path dir = coord.job_dir("s3", job.id);
    assert(fs::exists(dir / job.output_files[0]));
    assert(!fs::exists(dir / "Test Series - Chapter 001.epub"));
    assert(coord.delete_session("s3").success());
}

TEST(separate_documents_produce_separate_volumes) {
    auto sources = std::make_shared<MemorySourceProvider>();
    sources->add("s4", make_doc("a", {flat_page(300, 400, 10)}));
    sources->add("s4", make_doc("b", {flat_page(300, 400, 200)}));
    JobCoordinator coord(coordinator_config(), sources, nullptr);

    auto submitted = coord.submit(request_for("s4", {"a", "b"}));
    ConversionJob job = wait_for(coord, submitted.job.id);
    assert(job.phase == JobPhase::Completed);
    assert(job.volume_count == 2);
    assert(job.output_files.size() == 2);
    assert(job.output_files[0] == "Test Series - Chapter 001.epub");
    assert(job.output_files[1] == "Test Series - Chapter 002.epub");
    assert(coord.delete_session("s4").success());
}

TEST(merged_documents_share_one_volume) {
    auto sources = std::make_shared<MemorySourceProvider>();
    sources->add("s5", make_doc("a", {flat_page(300, 400, 40)}));
    sources->add("s5", make_doc("b", {flat_page(300, 400, 200)}));
    JobCoordinator coord(coordinator_config(), sources, nullptr);

    ConversionRequest req = request_for("s5", {"a", "b"});
    req.merge = true;
    req.transform.direction = ReadingDirection::RightToLeft;
    auto submitted = coord.submit(req);
    ConversionJob job = wait_for(coord, submitted.job.id);
    assert(job.phase == JobPhase::Completed);
    assert(job.volume_count == 1);
    assert(job.output_files.size() == 1);

    std::string epub = (fs::path(coord.job_dir("s5", job.id)) / job.output_files[0]).string();
    pugi::xml_document opf;
    std::string opf_text = read_entry(epub, "OEBPS/content.opf");
    assert(opf.load_string(opf_text.c_str()));
    pugi::xml_node spine = opf.child("package").child("spine");
    assert(std::string(spine.attribute("page-progression-direction").value()) == "rtl");
    std::vector<std::string> order;
    for (pugi::xml_node ref : spine.children("itemref")) order.push_back(ref.attribute("idref").value());
    assert(order.size() == 2);
    assert(order[0] == "page_0001" && order[1] == "page_0002");

    // First document's page comes first.
    assert(mean_shade(read_entry(epub, "OEBPS/images/page_0001.jpg")) < 100.0);
    assert(mean_shade(read_entry(epub, "OEBPS/images/page_0002.jpg")) > 150.0);
    assert(book_title(epub) == "Test Book");
    assert(coord.delete_session("s5").success());
}

TEST(separate_documents_keep_their_own_titles) {
    auto sources = std::make_shared<MemorySourceProvider>();
    sources->add("s16", make_doc("a", {flat_page(300, 400, 10)}));
    sources->add("s16", make_doc("b", {flat_page(300, 400, 200)}));
    JobCoordinator coord(coordinator_config(), sources, nullptr);

    auto submitted = coord.submit(request_for("s16", {"a", "b"}));
    ConversionJob job = wait_for(coord, submitted.job.id);
    assert(job.phase == JobPhase::Completed);
    assert(job.output_files.size() == 2);
    fs::path dir = coord.job_dir("s16", job.id);
    assert(book_title((dir / job.output_files[0]).string()) == "Test Book");
    assert(book_title((dir / job.output_files[1]).string()) == "Test Book");
    assert(coord.delete_session("s16").success());
}

TEST(split_separate_document_numbers_its_own_parts) {
    auto sources = std::make_shared<MemorySourceProvider>();
    std::vector<std::vector<uint8_t>> pages;
    for (int i = 0; i < 6; ++i) pages.push_back(noise_page(300, 400));
    sources->add("s17", make_doc("big", pages));
    sources->add("s17", make_doc("small", {flat_page(300, 400, 90)}));
    JobCoordinator coord(coordinator_config(), sources, nullptr);

    ConversionRequest req = request_for("s17", {"big", "small"});
    req.max_volume_bytes = 400000;
    auto submitted = coord.submit(req);
    assert(submitted.result.success());
    ConversionJob job = wait_for(coord, submitted.job.id);
    assert(job.phase == JobPhase::Completed);
    assert(job.volume_count >= 3);

    const std::string parts = std::to_string(job.volume_count - 1);
    fs::path dir = coord.job_dir("s17", job.id);
    for (int i = 0; i + 1 < job.volume_count; ++i) {
        std::string expected = "Test Book (Part " + std::to_string(i + 1) + "/" + parts + ")";
        assert(book_title((dir / job.output_files[static_cast<size_t>(i)]).string()) == expected);
    }
    assert(book_title((dir / job.output_files.back()).string()) == "Test Book");
    assert(coord.delete_session("s17").success());
}

TEST(merged_job_splits_under_small_budget) {
    auto sources = std::make_shared<MemorySourceProvider>();
    std::vector<std::vector<uint8_t>> pages;
    for (int i = 0; i < 6; ++i) pages.push_back(noise_page(300, 400));
    sources->add("s6", make_doc("big", pages));
    JobCoordinator coord(coordinator_config(), sources, nullptr);

    ConversionRequest req = request_for("s6", {"big"});
    req.merge = true;
    req.max_volume_bytes = 400000;
    auto submitted = coord.submit(req);
    assert(submitted.result.success());
    ConversionJob job = wait_for(coord, submitted.job.id);
    assert(job.phase == JobPhase::Completed);
    assert(job.volume_count >= 2);
    assert(static_cast<int>(job.output_files.size()) == job.volume_count);

    std::set<std::string> unique(job.output_files.begin(), job.output_files.end());
    assert(unique.size() == job.output_files.size());
    for (const auto& f : job.output_files) {
        assert(fs::exists(fs::path(coord.job_dir("s6", job.id)) / f));
    }
    assert(coord.delete_session("s6").success());
}

TEST(budget_rejected_at_submission) {
    auto sources = std::make_shared<MemorySourceProvider>();
    sources->add("s7", make_doc("ch1", {flat_page(300, 400, 90)}));
    JobCoordinator coord(coordinator_config(), sources, nullptr);

    ConversionRequest req = request_for("s7", {"ch1"});
    req.max_volume_bytes = 1000;
    auto submitted = coord.submit(req);
    assert(submitted.result.failure());
    assert(submitted.rejection == ErrorKind::BudgetValidation);
    assert(coord.list_jobs("s7").empty());
}

TEST(invalid_requests_rejected) {
    auto sources = std::make_shared<MemorySourceProvider>();
    sources->add("s8", make_doc("ch1", {flat_page(300, 400, 90)}));
    JobCoordinator coord(coordinator_config(), sources, nullptr);

    auto missing = coord.submit(request_for("s8", {"nope"}));
    assert(missing.result.failure());
    assert(missing.rejection == ErrorKind::Document);

    assert(coord.submit(request_for("s8", {})).result.failure());
    assert(coord.submit(request_for("s8", {"ch1", "ch1"})).result.failure());
    assert(coord.submit(request_for("../s8", {"ch1"})).result.failure());
    assert(!coord.status("unknown"));
}

TEST(broken_document_skipped_when_partial_allowed) {
    auto sources = std::make_shared<MemorySourceProvider>();
    sources->add("s9", make_doc("good", {flat_page(300, 400, 90)}));
    sources->add("s9", make_doc("bad", {{'x', 'y'}, {'z'}}));
    JobCoordinator coord(coordinator_config(), sources, nullptr);

    auto submitted = coord.submit(request_for("s9", {"bad", "good"}));
    ConversionJob job = wait_for(coord, submitted.job.id);
    assert(job.phase == JobPhase::Completed);
    assert(job.output_files.size() == 1);
    // The surviving document keeps its position in the name.
    assert(job.output_files[0] == "Test Series - Chapter 002.epub");
    assert(job.failed_pages.size() == 2);
    assert(!job.warnings.empty());
    assert(coord.delete_session("s9").success());
}

TEST(broken_document_fails_job_when_partial_disallowed) {
    auto sources = std::make_shared<MemorySourceProvider>();
    sources->add("s10", make_doc("good", {flat_page(300, 400, 90)}));
    sources->add("s10", make_doc("bad", {{'x', 'y'}}));
    JobCoordinator::Config cfg = coordinator_config();
    cfg.allow_partial = false;
    JobCoordinator coord(cfg, sources, nullptr);

    auto submitted = coord.submit(request_for("s10", {"good", "bad"}));
    ConversionJob job = wait_for(coord, submitted.job.id);
    assert(job.phase == JobPhase::Failed);
    assert(job.error && job.error->kind == ErrorKind::Document);
    assert(job.output_files.empty());
    assert(!coord.outputs(job.id));
    assert(coord.bundle(job.id, (output_root() / "never.zip").string()).failure());
    assert(coord.delete_session("s10").success());
}

TEST(list_bundle_and_delete_session) {
    auto sources = std::make_shared<MemorySourceProvider>();
    sources->add("s11", make_doc("a", {flat_page(300, 400, 30)}));
    sources->add("s11", make_doc("b", {flat_page(300, 400, 160)}));
    sources->add("other", make_doc("c", {flat_page(300, 400, 90)}));
    JobCoordinator coord(coordinator_config(), sources, nullptr);

    auto first = coord.submit(request_for("s11", {"a", "b"}));
    auto second = coord.submit(request_for("other", {"c"}));
    ConversionJob job = wait_for(coord, first.job.id);
    wait_for(coord, second.job.id);

    assert(coord.list_jobs("s11").size() == 1);
    assert(coord.list_jobs().size() == 2);

    fs::path zip = output_root() / "bundle_test.zip";
    assert(coord.bundle(job.id, zip.string()).success());
    assert(fs::exists(zip));
    std::vector<uint8_t> bytes;
    assert(read_file(zip.string(), bytes));
    assert(bytes.size() > 4 && bytes[0] == 'P' && bytes[1] == 'K');
    fs::remove(zip);

    assert(coord.delete_session("s11").success());
    assert(coord.list_jobs("s11").empty());
    assert(!coord.status(job.id));
    assert(!fs::exists(output_root() / "s11"));
    assert(coord.list_jobs("other").size() == 1);
    assert(coord.delete_session("other").success());
}

TEST(delete_session_cancels_running_job) {
    auto sources = std::make_shared<MemorySourceProvider>();
    std::vector<std::vector<uint8_t>> pages;
    for (int i = 0; i < 20; ++i) pages.push_back(noise_page(600, 800));
    sources->add("s12", make_doc("long", pages));
    JobCoordinator coord(coordinator_config(), sources, nullptr);

    auto submitted = coord.submit(request_for("s12", {"long"}));
    assert(submitted.result.success());
    assert(coord.delete_session("s12").success());
    assert(!coord.status(submitted.job.id));
    assert(!fs::exists(output_root() / "s12"));
}

class BrokenUpscaler : public Upscaler {
public:
    Result upscale(const cv::Mat&, double, cv::Mat&, const std::atomic<bool>&) const override {
        return Result::fail(ErrorCode::EXTERNAL_TOOL_ERROR, "model not loaded");
    }
    const char* name() const override { return "broken"; }
};

TEST(external_upscaler_failure_falls_back_with_warning) {
    auto sources = std::make_shared<MemorySourceProvider>();
    sources->add("s13", make_doc("small", {flat_page(150, 200, 70), flat_page(150, 200, 140)}));
    JobCoordinator coord(coordinator_config(), sources, nullptr);
    coord.set_external_upscaler(std::make_shared<BrokenUpscaler>());

    ConversionRequest req = request_for("s13", {"small"});
    req.transform.upscale = UpscaleMethod::External;
    auto submitted = coord.submit(req);
    assert(submitted.result.success());

    ConversionJob job = wait_for(coord, submitted.job.id);
    assert(job.phase == JobPhase::Completed);
    assert(job.output_files.size() == 1);
    assert(job.warnings.size() >= 2);
    assert(coord.delete_session("s13").success());
}

TEST(directory_source_provider_reads_uploads) {
    fs::path uploads = output_root() / "uploads";
    fs::path extracted = uploads / "s14" / "vol1_images";
    fs::path plain = uploads / "s14" / "vol2";
    fs::create_directories(extracted);
    fs::create_directories(plain);
    assert(write_file((extracted / "page10.jpg").string(), flat_page(300, 400, 200)));
    assert(write_file((extracted / "page2.jpg").string(), flat_page(300, 400, 20)));
    assert(write_file((extracted / "notes.txt").string(), {'h', 'i'}));
    assert(write_file((plain / "001.jpg").string(), flat_page(300, 400, 100)));

    auto sources = std::make_shared<DirectorySourceProvider>(uploads.string(), ReadingDirection::RightToLeft);
    assert(sources->contains("s14", "vol1"));
    assert(sources->contains("s14", "vol2"));
    assert(!sources->contains("s14", "vol3"));
    assert(!sources->contains("s14", "../s14/vol1"));
    assert(!sources->contains("..", "vol1"));

    SourceDocument doc;
    assert(sources->open("s14", "vol1", doc).success());
    assert(doc.pages.size() == 2);
    assert(doc.pages[0].name == "page2.jpg");
    assert(doc.pages[1].name == "page10.jpg");
    assert(sources->open("s14", "missing", doc).failure());

    auto summary = sources->describe("s14", "vol1");
    assert(summary && summary->page_count == 2);

    JobCoordinator coord(coordinator_config(), sources, nullptr);
    auto submitted = coord.submit(request_for("s14", {"vol1", "vol2"}));
    assert(submitted.result.success());
    ConversionJob job = wait_for(coord, submitted.job.id);
    assert(job.phase == JobPhase::Completed);
    assert(job.output_files.size() == 2);
    assert(coord.delete_session("s14").success());
}

TEST(converter_command_lookup) {
    assert(command_available("sh"));
    assert(!command_available("panelpress-no-such-tool"));
    assert(!command_available(""));
    // A missing tool still yields a converter; its failures surface per volume.
    auto converter = create_converter(true, "panelpress-no-such-tool");
    assert(converter);
    assert(std::string(create_converter(false, "ebook-convert")->name()) == "disabled");
}

// Descriptors visible to a freshly started child.
static int open_descriptor_count() {
    ProcessResult proc = run_process({"ls", "/proc/self/fd"});
    assert(proc.ok());
    std::istringstream entries(proc.output);
    std::string entry;
    int count = 0;
    while (entries >> entry) ++count;
    return count;
}

TEST(children_do_not_inherit_pipes_of_other_runs) {
    const int baseline = open_descriptor_count();
    ProcessResult slow;
    std::thread runner([&slow]() { slow = run_process({"sleep", "1"}); });
    std::this_thread::sleep_for(std::chrono::milliseconds(300));
    const int during = open_descriptor_count();
    runner.join();
    assert(slow.ok());
    assert(during == baseline);
}

TEST(released_session_sources_are_gone) {
    auto sources = std::make_shared<MemorySourceProvider>();
    sources->add("s15", make_doc("x", {flat_page(300, 400, 50)}));
    assert(sources->contains("s15", "x"));
    sources->remove_session("s15");
    assert(!sources->contains("s15", "x"));

    JobCoordinator coord(coordinator_config(), sources, nullptr);
    auto submitted = coord.submit(request_for("s15", {"x"}));
    assert(submitted.result.failure());
}

int main() {
    std::cout << "=== PanelPress Coordinator Test Suite ===\n\n";
    log::set_quiet(true);
    std::error_code ec;
    fs::remove_all(output_root(), ec);

    RUN_TEST(single_document_to_epub);
    RUN_TEST(failed_legacy_conversion_keeps_epub);
    RUN_TEST(legacy_only_output_replaces_epub);
    RUN_TEST(separate_documents_produce_separate_volumes);
    RUN_TEST(merged_documents_share_one_volume);
    RUN_TEST(separate_documents_keep_their_own_titles);
    RUN_TEST(split_separate_document_numbers_its_own_parts);
    RUN_TEST(merged_job_splits_under_small_budget);
    RUN_TEST(budget_rejected_at_submission);
    RUN_TEST(invalid_requests_rejected);
    RUN_TEST(broken_document_skipped_when_partial_allowed);
    RUN_TEST(broken_document_fails_job_when_partial_disallowed);
    RUN_TEST(list_bundle_and_delete_session);
    RUN_TEST(delete_session_cancels_running_job);
    RUN_TEST(external_upscaler_failure_falls_back_with_warning);
    RUN_TEST(directory_source_provider_reads_uploads);
    RUN_TEST(converter_command_lookup);
    RUN_TEST(children_do_not_inherit_pipes_of_other_runs);
    RUN_TEST(released_session_sources_are_gone);

    fs::remove_all(output_root(), ec);

    std::cout << "\n=== Test Summary ===\n";
    std::cout << "Failures: " << failures << "\n";

    if (failures == 0) {
        std::cout << "\nAll coordinator tests passed.\n";
        return 0;
    }

    std::cout << "\nSome coordinator tests failed.\n";
    return 1;
}
