#include <iostream>
#include <cassert>
#include <vector>
#include <string>
#include <stdexcept>

#include "../src/job/job.hpp"
#include "../src/job/job_state.hpp"
#include "../src/util/log.hpp"

#include <nlohmann/json.hpp>

using namespace panelpress;

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

static ConversionJob new_job(bool merge) {
    ConversionJob job;
    job.id = "job1";
    job.session_id = "s1";
    job.merge = merge;
    return job;
}

TEST(separate_job_walks_forward) {
    ConversionJob job = new_job(false);
    JobStateMachine state(job);
    assert(job.phase == JobPhase::Pending);
    assert(state.advance(JobPhase::Extracting));
    assert(state.advance(JobPhase::Processing));
    assert(!state.advance(JobPhase::Merging));
    assert(state.advance(JobPhase::Converting));
    assert(!state.advance(JobPhase::Splitting));
    assert(state.complete({"a.epub"}));
    assert(job.phase == JobPhase::Completed);
    assert(job.progress == 100.0);
    assert(job.output_files.size() == 1);
    assert(job.completed_ms > 0);
}

TEST(merge_job_visits_merging_and_splitting) {
    ConversionJob job = new_job(true);
    JobStateMachine state(job);
    assert(state.advance(JobPhase::Extracting));
    assert(state.advance(JobPhase::Processing));
    assert(state.advance(JobPhase::Merging));
    assert(state.advance(JobPhase::Converting));
    assert(state.advance(JobPhase::Splitting));
    assert(state.complete({"a_part01.epub", "a_part02.epub"}));
    assert(job.phase == JobPhase::Completed);
}

TEST(no_backward_or_repeated_transitions) {
    ConversionJob job = new_job(false);
    JobStateMachine state(job);
    assert(state.advance(JobPhase::Processing));
    assert(!state.advance(JobPhase::Extracting));
    assert(!state.advance(JobPhase::Processing));
    assert(!state.advance(JobPhase::Pending));
    assert(job.phase == JobPhase::Processing);
}

TEST(terminal_states_only_through_complete_or_fail) {
    ConversionJob job = new_job(false);
    JobStateMachine state(job);
    assert(!state.advance(JobPhase::Completed));
    assert(!state.advance(JobPhase::Failed));
    // complete() is valid only once packaging has started.
    assert(!state.complete({}));
    assert(state.advance(JobPhase::Extracting));
    assert(!state.complete({}));
    assert(job.phase == JobPhase::Extracting);
}

TEST(fail_from_any_non_terminal_phase) {
    const JobPhase phases[] = {JobPhase::Pending, JobPhase::Extracting, JobPhase::Processing,
                               JobPhase::Merging, JobPhase::Converting, JobPhase::Splitting};
    for (JobPhase phase : phases) {
        ConversionJob job = new_job(true);
        job.phase = phase;
        job.output_files = {"stale.epub"};
        JobStateMachine state(job);
        assert(state.fail(ErrorKind::Fatal, "boom"));
        assert(job.phase == JobPhase::Failed);
        assert(job.error && job.error->kind == ErrorKind::Fatal);
        assert(job.error->message == "boom");
        assert(job.output_files.empty());
    }
}

TEST(terminal_jobs_are_frozen) {
    ConversionJob job = new_job(false);
    JobStateMachine state(job);
    assert(state.advance(JobPhase::Converting));
    assert(state.complete({"a.epub"}));
    assert(!state.fail(ErrorKind::Fatal, "late"));
    assert(!state.advance(JobPhase::Splitting));
    assert(!job.error);

    ConversionJob failed = new_job(false);
    JobStateMachine fstate(failed);
    assert(fstate.fail(ErrorKind::Cancelled, "cancelled"));
    assert(!fstate.fail(ErrorKind::Fatal, "again"));
    assert(failed.error->kind == ErrorKind::Cancelled);
    fstate.report_progress(50.0);
    assert(failed.progress == 0.0);
}

TEST(fail_keeps_requested_files) {
    ConversionJob job = new_job(false);
    JobStateMachine state(job);
    assert(state.advance(JobPhase::Converting));
    assert(state.fail(ErrorKind::Fatal, "disk full", {"a.epub"}));
    assert(job.output_files.size() == 1);
}

TEST(progress_is_monotone_and_clamped) {
    ConversionJob job = new_job(false);
    JobStateMachine state(job);
    state.report_progress(10.0);
    assert(job.progress == 10.0);
    state.report_progress(5.0);
    assert(job.progress == 10.0);
    state.report_progress(150.0);
    assert(job.progress == 99.0);
    state.report_progress(-3.0);
    assert(job.progress == 99.0);
    assert(state.advance(JobPhase::Converting));
    assert(state.complete({}));
    assert(job.progress == 100.0);
}

TEST(current_file_cleared_on_finish) {
    ConversionJob job = new_job(false);
    JobStateMachine state(job);
    state.set_current_file("page001.jpg");
    assert(job.current_file && *job.current_file == "page001.jpg");
    assert(state.fail(ErrorKind::Document, "unreadable"));
    assert(!job.current_file);
    state.set_current_file("page002.jpg");
    assert(!job.current_file);
}

TEST(warnings_and_failed_pages_accumulate) {
    ConversionJob job = new_job(false);
    JobStateMachine state(job);
    state.add_warning("mobi skipped");
    state.add_failed_page("ch1/p3.jpg: cannot decode");
    assert(job.warnings.size() == 1);
    assert(job.failed_pages.size() == 1);
}

TEST(progress_model_weights) {
    ProgressModel model;
    model.set_pages(9);
    model.set_expected_volumes(1);
    assert(model.percent() == 0.0);
    for (int i = 0; i < 9; ++i) model.page_done();
    assert(model.percent() > 89.0 && model.percent() < 99.0);
    model.set_volumes(1);
    model.volume_done();
    assert(model.percent() == 99.0);
    model.page_done();
    assert(model.percent() == 99.0);
}

TEST(json_status_fields) {
    ConversionJob job = new_job(false);
    job.source_ids = {"doc\"1"};
    job.created_ms = 1700000000000;
    JobStateMachine state(job);
    state.set_current_file("p.jpg");
    nlohmann::json j = nlohmann::json::parse(to_json(job));
    assert(j["status"] == "pending");
    assert(j["current_file"] == "p.jpg");
    assert(j["sources"][0] == "doc\"1");
    assert(j["error"].is_null());
    assert(j["completed_at"].is_null());
    assert(j["created_at"] == "2023-11-14T22:13:20Z");

    assert(state.fail(ErrorKind::BudgetValidation, "too small"));
    j = nlohmann::json::parse(to_json(job));
    assert(j["error"]["kind"] == "budget_validation");
    assert(j["error"]["message"] == "too small");
    assert(j["status"] == "failed");
}

TEST(json_status_survives_invalid_utf8_names) {
    ConversionJob job = new_job(false);
    JobStateMachine state(job);
    state.set_current_file("Cap\xedtulo 1");
    state.add_warning("bad \xff byte");
    std::string text = to_json(job);
    nlohmann::json j = nlohmann::json::parse(text);
    assert(j["current_file"] == "Cap\xef\xbf\xbdtulo 1");
    assert(j["warnings"][0] == "bad \xef\xbf\xbd byte");
}

TEST(phase_names) {
    assert(std::string(to_string(JobPhase::Splitting)) == "splitting");
    assert(std::string(to_string(ErrorKind::SecondaryFormat)) == "secondary_format");
    assert(is_terminal(JobPhase::Failed));
    assert(!is_terminal(JobPhase::Converting));
    assert(phase_order(JobPhase::Merging) < phase_order(JobPhase::Converting));
}

int main() {
    std::cout << "=== PanelPress Job State Test Suite ===\n\n";
    log::set_quiet(true);

    RUN_TEST(separate_job_walks_forward);
    RUN_TEST(merge_job_visits_merging_and_splitting);
    RUN_TEST(no_backward_or_repeated_transitions);
    RUN_TEST(terminal_states_only_through_complete_or_fail);
    RUN_TEST(fail_from_any_non_terminal_phase);
    RUN_TEST(terminal_jobs_are_frozen);
    RUN_TEST(fail_keeps_requested_files);
    RUN_TEST(progress_is_monotone_and_clamped);
    RUN_TEST(current_file_cleared_on_finish);
    RUN_TEST(warnings_and_failed_pages_accumulate);
    RUN_TEST(progress_model_weights);
    RUN_TEST(json_status_fields);
    RUN_TEST(json_status_survives_invalid_utf8_names);
    RUN_TEST(phase_names);

    std::cout << "\n=== Test Summary ===\n";
    std::cout << "Failures: " << failures << "\n";

    if (failures == 0) {
        std::cout << "\nAll job state tests passed.\n";
        return 0;
    }

    std::cout << "\nSome job state tests failed.\n";
    return 1;
}
