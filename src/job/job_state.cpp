#include "job/job_state.hpp"
#include "util/log.hpp"
#include "util/text.hpp"

#include <algorithm>

namespace panelpress {

bool is_terminal(JobPhase phase) {
    return phase == JobPhase::Completed || phase == JobPhase::Failed;
}

int phase_order(JobPhase phase) {
    return static_cast<int>(phase);
}

bool JobStateMachine::advance(JobPhase next) {
    if (is_terminal(job_.phase) || is_terminal(next)) return false;
    if (phase_order(next) <= phase_order(job_.phase)) return false;
    if ((next == JobPhase::Merging || next == JobPhase::Splitting) && !job_.merge) return false;
    log::info("job " + job_.id + ": " + to_string(job_.phase) + " -> " + to_string(next));
    job_.phase = next;
    return true;
}

bool JobStateMachine::complete(std::vector<std::string> output_files) {
    if (job_.phase != JobPhase::Converting && job_.phase != JobPhase::Splitting) return false;
    job_.output_files = std::move(output_files);
    job_.phase = JobPhase::Completed;
    job_.progress = 100.0;
    finish();
    log::info("job " + job_.id + ": completed with " + std::to_string(job_.output_files.size()) + " file(s)");
    return true;
}

bool JobStateMachine::fail(ErrorKind kind, const std::string& message, std::vector<std::string> kept) {
    if (is_terminal(job_.phase)) return false;
    job_.error = JobError{kind, message};
    job_.phase = JobPhase::Failed;
    job_.output_files = std::move(kept);
    finish();
    log::error("job " + job_.id + " failed (" + to_string(kind) + "): " + message);
    return true;
}

void JobStateMachine::finish() {
    job_.current_file.reset();
    job_.completed_ms = now_unix_ms();
}

void JobStateMachine::report_progress(double percent) {
    if (is_terminal(job_.phase)) return;
    double clamped = std::clamp(percent, 0.0, 99.0);
    job_.progress = std::max(job_.progress, clamped);
}

void JobStateMachine::set_current_file(const std::string& name) {
    if (is_terminal(job_.phase)) return;
    job_.current_file = name;
}

void JobStateMachine::add_warning(const std::string& warning) {
    job_.warnings.push_back(warning);
}

void JobStateMachine::add_failed_page(const std::string& page) {
    job_.failed_pages.push_back(page);
}

double ProgressModel::percent() const {
    int volumes = volumes_total_ > 0 ? volumes_total_ : std::max(1, volumes_expected_);
    int total = pages_total_ + volumes;
    if (total <= 0) return 0.0;
    int done = std::min(pages_done_, pages_total_) + std::min(volumes_done_, volumes);
    return 99.0 * static_cast<double>(done) / static_cast<double>(total);
}

}
