// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#include "logging.h"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <filesystem>
#include <fstream>

#include <fmt/core.h>
#include <fmt/chrono.h>
#include <nlohmann/json.hpp>

#include "data/batch_assembler.h"

namespace {

//! JSON string literal (quoted and escaped)
std::string json_str(std::string_view text) {
    return nlohmann::json(text).dump();
}

//! JSON number; non-finite values become null
std::string json_num(float value) {
    return std::isfinite(value) ? fmt::format("{}", value) : std::string("null");
}

//! JSON object of the metrics; non-finite values become null
std::string json_metrics(const MetricsMap& metrics) {
    return nlohmann::json(metrics).dump();
}

} // namespace

/**
 * @brief Create a logger that writes a JSON array to @p file_name (rank 0 only).
 *
 * On rank 0, ensures the parent directory exists, opens the file for output,
 * and initializes it as a JSON array (writes "[ ... ]").
 *
 * @param file_name Output path for the JSON log; empty to only print.
 * @param rank Worker rank; only rank 0 writes the JSON file and prints most output.
 * @param verbosity Verbosity level controlling stdout printing.
 * @param append Keep the records of an existing log file (resumed runs). A file that
 *        is not a JSON array is replaced.
 */
TrainingRunLogger::TrainingRunLogger(const std::string& file_name, int rank, EVerbosity verbosity, bool append) :
    mFileName(file_name), mRank(rank), mVerbosity(verbosity)
{
    if(mRank == 0 && !mFileName.empty()) {
        auto log_path = std::filesystem::path(mFileName).parent_path();
        if (!log_path.empty()) {
            std::filesystem::create_directories(log_path);
        }
        nlohmann::json previous = nlohmann::json::array();
        if (append && std::filesystem::exists(mFileName)) {
            std::ifstream in(mFileName);
            nlohmann::json parsed = nlohmann::json::parse(in, nullptr, false);
            if (parsed.is_array()) {
                previous = std::move(parsed);
            } else {
                fprintf(stderr, "WARNING: existing log file `%s` is not a JSON array, starting a new one\n", mFileName.c_str());
            }
        }
        mLogFile.open(mFileName, std::fstream::out);
        if (!mLogFile) {
            throw std::runtime_error(fmt::format("Could not open log file `{}`", mFileName));
        }
        mLogFile << "[\n";
        for (const auto& record : previous) {
            if (!mFirst) mLogFile << ",\n";
            mLogFile << "  " << record.dump();
            mFirst = false;
        }
        mLogFile << "\n]\n";
        mLogFile.flush();
    }
}

/**
 * @brief Destructor; closes the log file if open.
 */
TrainingRunLogger::~TrainingRunLogger()
{
    if(mLogFile.is_open()) mLogFile.close();
}

void TrainingRunLogger::set_callback(std::function<void(std::string_view)> cb) {
    mCallback = std::move(cb);
}

/**
 * @brief Log the command line used to start the run (rank 0 only).
 *
 * Writes a JSON line containing argv as an array of strings.
 *
 * @param argc Argument count.
 * @param argv Argument vector; expected to be @p argc entries.
 */
void TrainingRunLogger::log_cmd(int argc, const char** argv)
{
    if(mRank != 0) return;
    std::string cmd = fmt::format(R"(  {{"log": "cmd", "time": "{}", "step": 0, "cmd": [)", std::chrono::system_clock::now());
    for (int i = 0; i < argc; i++)
    {
        if (i != 0) cmd += ", ";
        cmd += json_str(argv[i]);
    }
    cmd += "]}";
    log_line(cmd);
}

/**
 * @brief Log configuration options (rank 0 only).
 *
 * Each option is written as a JSON log line and, with verbose output, printed.
 *
 * @param options Vector of (name, value) pairs; value may be bool, int64, float, or std::string.
 */
void TrainingRunLogger::log_options(const std::vector<std::pair<std::string_view, std::variant<bool, std::int64_t, float, std::string>>>& options) {
    if(mRank != 0) return;

    int option_length = 0;
    for(auto& [name, value]: options) {
        option_length = std::max(option_length, static_cast<int>(name.size()));
    }

    for(auto& [name, value]: options) {
        auto log = [&](auto&& v){
            if constexpr (std::is_same_v<std::remove_cvref_t<decltype(v)>, std::string>) {
                log_line(fmt::format(R"(  {{"log": "option", "time": "{}", "step": 0, "name": "{}", "value": {}}})",
                                     std::chrono::system_clock::now(), name, json_str(v)));
            } else {
                log_line(fmt::format(R"(  {{"log": "option", "time": "{}", "step": 0, "name": "{}", "value": {}}})",
                                     std::chrono::system_clock::now(), name, v));
            }
            if (mVerbosity >= 1) {
                printf("  %-*s : %s\n", option_length, std::string(name).c_str(), fmt::format("{}", v).c_str());
            }
        };
        std::visit(log, value);
    }
}

/**
 * @brief Log the composition of the training epoch and the size of the eval split (rank 0 only).
 */
void TrainingRunLogger::log_dataset(const EpochPlanStats& train, int eval_examples, int eval_batches) {
    if(mRank != 0) return;
    log_line(fmt::format(R"(  {{"log": "dataset", "split": "train", "time": "{}", "step": 0, "desirable": {}, "undesirable": {}, "unique_desirable": {}, "unique_undesirable": {}, "batches": {}}})",
        std::chrono::system_clock::now(), train.Desirable, train.Undesirable, train.UniqueDesirable, train.UniqueUndesirable, train.Batches));
    log_line(fmt::format(R"(  {{"log": "dataset", "split": "eval", "time": "{}", "step": 0, "examples": {}, "batches": {}}})",
        std::chrono::system_clock::now(), eval_examples, eval_batches));

    if (mVerbosity >= 0) {
        printf("[Dataset]\n");
        printf(" train: %ld desirable (%ld unique), %ld undesirable (%ld unique), %ld batches\n",
               train.Desirable, train.UniqueDesirable, train.Undesirable, train.UniqueUndesirable, train.Batches);
        printf(" eval:  %d examples, %d batches\n\n", eval_examples, eval_batches);
    }
}

/**
 * @brief Log a training step (rank 0 only).
 *
 * Updates running totals used to compute average training loss between evals.
 * Writes a JSON line and optionally prints a compact progress line.
 *
 * @param step Number of optimizer updates so far.
 * @param epoch Fractional epoch progress (used to compute percent-within-epoch).
 * @param examples Examples processed since the last step log.
 * @param duration_ms Time since the last step log in milliseconds.
 * @param norm Gradient norm before clipping.
 * @param loss Mean training loss since the last step log.
 * @param lr Learning rate of the last update.
 * @param metrics All metrics of this log interval.
 */
void TrainingRunLogger::log_step(long step, float epoch, long examples, int duration_ms, float norm, float loss, float lr,
                                 const MetricsMap& metrics)
{
    if(mRank != 0) return;
    mTotalTrainingLoss += loss;
    ++mTotalTrainingSteps;

    if(mVerbosity >= 0) {
        float iptr;
        float progress = 100.f * std::modf(epoch,  &iptr);

        // examples per second
        float eps = (duration_ms > 0) ? (1000.f * examples / duration_ms) : 0.f;

        // Loss trend indicator
        char trend = ' ';
        if (mPreviousLoss > 0) {
            if (loss < mPreviousLoss) {
                trend = '\\';
            } else if (loss > mPreviousLoss) {
                trend = '/';
            }
        }
        mPreviousLoss = loss;

        printf(":: step %7ld [%5.1f%%] %c loss %6.4f | norm %6.4f | %7.1f ex/s | lr %.3g\n",
               step, progress, trend, loss, norm, eps, lr);
        fflush(stdout);
    }
    log_line(fmt::format(R"(  {{"log": "step", "time": "{}", "step": {}, "epoch": {}, "examples": {}, "duration_ms": {}, "norm": {}, "loss": {}, "lr": {}, "metrics": {}}})",
        std::chrono::system_clock::now(), step, epoch, examples, duration_ms,
        json_num(norm), json_num(loss), lr, json_metrics(metrics)));
}

/**
 * @brief Log an evaluation result (rank 0 only).
 *
 * Prints an eval line (verbosity-dependent), resets accumulated training-loss totals,
 * and writes a JSON line with the eval metrics.
 */
void TrainingRunLogger::log_eval(long step, float epoch, int eval_examples, int duration_ms, float loss, const MetricsMap& metrics)
{
    if(mRank != 0) return;
    if(mVerbosity >= -1) {
        float train_avg = static_cast<float>(mTotalTrainingLoss / std::max(mTotalTrainingSteps, 1));
        float gap = mTotalTrainingSteps > 0 ? loss - train_avg : 0.f;
        printf("\x1b[1m>> eval          loss %6.4f | gap %+7.4f | %5d examples | %5d ms\x1b[22m\n",
               loss, gap, eval_examples, duration_ms);
        fflush(stdout);
    }
    mTotalTrainingLoss = 0;
    mTotalTrainingSteps = 0;
    log_line(fmt::format(R"(  {{"log": "eval", "time": "{}", "step": {}, "epoch": {}, "eval_examples": {}, "duration_ms": {}, "metrics": {}}})",
        std::chrono::system_clock::now(), step, epoch, eval_examples, duration_ms, json_metrics(metrics)));
}

void TrainingRunLogger::log_checkpoint(long step, const std::string& path) {
    if(mRank != 0) return;
    if(mVerbosity >= 0) {
        printf("checkpoint written to %s\n", path.c_str());
    }
    log_line(fmt::format(R"(  {{"log": "checkpoint", "time": "{}", "step": {}, "path": {}}})",
                         std::chrono::system_clock::now(), step, json_str(path)));
}

/**
 * @brief Log a warning (rank 0 only); printed unless output is silenced.
 */
void TrainingRunLogger::log_warning(long step, const std::string& msg) {
    if(mRank != 0) return;
    if(mVerbosity >= -1) {
        fprintf(stderr, "\033[33mWARNING: %s\033[0m\n", msg.c_str());
    }
    log_line(fmt::format(R"(  {{"log": "warning", "time": "{}", "step": {}, "message": {}}})",
                         std::chrono::system_clock::now(), step, json_str(msg)));
}

/**
 * @brief Log an informational message (rank 0 only).
 *
 * Prints to stdout (verbosity-dependent) and writes a JSON "info" record.
 *
 * @param step Step associated with this message.
 * @param msg Message text.
 */
void TrainingRunLogger::log_message(long step, const std::string& msg) {
    if(mRank != 0) return;
    if(mVerbosity >= 0) {
        fprintf(stdout, "%s\n", msg.c_str());
    }
    log_line(fmt::format(R"(  {{"log": "info", "time": "{}", "step": {}, "message": {}}})",
                         std::chrono::system_clock::now(), step, json_str(msg)));
}

/**
 * @brief Begin a timed logging section (rank 0 only).
 *
 * Stores section metadata in the logger and returns an RAII handle that will
 * call log_section_end() on destruction (when constructed with a valid logger).
 *
 * @param step Step associated with this section.
 * @param info Human-readable description printed to stdout and stored in JSON.
 * @return RAII_Section handle; on non-zero ranks, contains nullptr and is a no-op.
 */
TrainingRunLogger::RAII_Section TrainingRunLogger::log_section_start(long step, const std::string& info) {
    if(mRank != 0) return RAII_Section{nullptr};
    mSectionInfo = info;
    mSectionStep = step;
    mSectionStart = std::chrono::steady_clock::now();
    if(mVerbosity >= 0) {
        printf("%s ...\n", info.data());
    }
    return RAII_Section{this};
}

/**
 * @brief End the current timed section and emit its duration (rank 0 only).
 */
void TrainingRunLogger::log_section_end() {
    auto duration = std::chrono::steady_clock::now() - mSectionStart;
    long milliseconds = std::chrono::duration_cast<std::chrono::milliseconds>(duration).count();
    if(mRank != 0) return;
    log_line(fmt::format(R"(  {{"log": "info", "time": "{}", "step": {}, "message": {}, "duration_ms": {}}})",
                         std::chrono::system_clock::now(), mSectionStep, json_str(mSectionInfo), milliseconds ));

    if(mVerbosity >= 0) {
        if(milliseconds < 2000) {
            printf("  done in %ld ms\n\n", milliseconds);
        } else {
            printf("  done in %ld s\n\n", milliseconds / 1000);
        }
    }
}

/**
 * @brief Append one JSON object line to the log file (and emit callback if set).
 *
 * The file is maintained as a valid JSON array by seeking near the end and
 * overwriting the array closing tokens. The caller should pass a complete JSON
 * object (no trailing comma).
 *
 * @param line JSON object line to append.
 */
void TrainingRunLogger::log_line(std::string_view line) {
    if(mCallback)
        mCallback(line);
    if(!mLogFile.is_open())
        return;
    mLogFile.seekp(-3, std::ios::end);  // overwrite the array closing part
    if (!mFirst)
    {
        mLogFile << ",\n";
    }
    mLogFile << line << "\n]" << std::endl;
    mFirst = false;
}
