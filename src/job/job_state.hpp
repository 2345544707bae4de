#pragma once

#include "job/job.hpp"
#include <string>
#include <vector>

namespace panelpress {

bool is_terminal(JobPhase phase);
int phase_order(JobPhase phase);

// The only writer of a job's phase, progress and terminal fields. Callers
// serialise access per job.
class JobStateMachine {
public:
    explicit JobStateMachine(ConversionJob& job) : job_(job) {}

    // Strictly forward; merging and splitting only for merge jobs. Terminal
    // states are entered through complete() and fail().
    bool advance(JobPhase next);
    bool complete(std::vector<std::string> output_files);
    // Output files survive only through `kept`, for policies that keep partial output.
    bool fail(ErrorKind kind, const std::string& message, std::vector<std::string> kept = {});

    // Clamped to [0, 99] and never lowered.
    void report_progress(double percent);
    void set_current_file(const std::string& name);
    void add_warning(const std::string& warning);
    void add_failed_page(const std::string& page);

private:
    ConversionJob& job_;

    void finish();
};

// Transform units weigh one per source page, assembly units one per volume.
class ProgressModel {
public:
    void set_pages(int total) { pages_total_ = total; }
    void set_expected_volumes(int count) { volumes_expected_ = count; }
    void set_volumes(int count) { volumes_total_ = count; }
    void page_done() { ++pages_done_; }
    void volume_done() { ++volumes_done_; }

    double percent() const;

private:
    int pages_total_ = 0;
    int pages_done_ = 0;
    int volumes_expected_ = 1;
    int volumes_total_ = 0;
    int volumes_done_ = 0;
};

}
