// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#ifndef HALO_SRC_TRAINING_LOGGING_H
#define HALO_SRC_TRAINING_LOGGING_H

#include <chrono>
#include <cstdint>
#include <fstream>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

struct EpochPlanStats;

//! Named scalar metrics, e.g. `loss/train` or `rewards_eval/margins`.
using MetricsMap = std::map<std::string, float>;

class TrainingRunLogger
{
public:
    enum EVerbosity {
        SILENT = -2,
        QUIET = -1,
        DEFAULT = 0,
        VERBOSE = 1
    };

    //! An empty `file_name` disables the JSON log file. With `append`, records of an existing file are kept.
    TrainingRunLogger(const std::string& file_name, int rank, EVerbosity verbosity, bool append = false);
    ~TrainingRunLogger();

    void set_callback(std::function<void(std::string_view)> cb);

    void log_cmd(int argc, const char** argv);
    void log_options(const std::vector<std::pair<std::string_view, std::variant<bool, std::int64_t, float, std::string>>>& options);
    void log_dataset(const EpochPlanStats& train, int eval_examples, int eval_batches);
    void log_step(long step, float epoch, long examples, int duration_ms, float norm, float loss, float lr, const MetricsMap& metrics);
    void log_eval(long step, float epoch, int eval_examples, int duration_ms, float loss, const MetricsMap& metrics);
    void log_checkpoint(long step, const std::string& path);
    void log_warning(long step, const std::string& msg);

    // call at the beginning and end of a section of processing.
    // will record the time between the two calls
    class RAII_Section {
    public:
        ~RAII_Section() noexcept {
            if(mLogger)
                mLogger->log_section_end();
        };
    private:
        RAII_Section(TrainingRunLogger* l) : mLogger(l) {}
        RAII_Section(RAII_Section&&) = default;
        TrainingRunLogger* mLogger;

        friend class TrainingRunLogger;
    };

    void log_message(long step, const std::string& msg);
    RAII_Section log_section_start(long step, const std::string& info);
    void log_section_end();

    [[nodiscard]] int rank() const { return mRank; }
    [[nodiscard]] EVerbosity verbosity() const { return mVerbosity; }

private:
    void log_line(std::string_view line);
    std::string mFileName;
    std::fstream mLogFile;
    bool mFirst = true;

    int mRank;
    EVerbosity mVerbosity;

    // running mean for training loss
    double mTotalTrainingLoss = 0.0;
    int mTotalTrainingSteps = 0;
    float mPreviousLoss = -1.f;

    // arbitrary callback for log lines
    std::function<void(std::string_view)> mCallback;

    // log section is a two-step process, here we safe intermediaries
    std::string mSectionInfo;
    long mSectionStep = 0;
    std::chrono::steady_clock::time_point mSectionStart;
};

#endif //HALO_SRC_TRAINING_LOGGING_H
