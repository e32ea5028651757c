// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "data/example_source.h"

#include <algorithm>
#include <deque>
#include <filesystem>
#include <fstream>
#include <numeric>
#include <random>

#include <fmt/core.h>
#include <nlohmann/json.hpp>

#include "utilities/philox.h"
#include "utilities/utils.h"

const char* example_shape_to_str(EExampleShape shape) {
    switch (shape) {
        case EExampleShape::SFT: return "sft";
        case EExampleShape::PAIRED: return "paired";
        case EExampleShape::UNPAIRED: return "unpaired";
    }
    return "unknown";
}

namespace {

struct RawRecord {
    RecordLocation Where;
    std::string Text;
};

std::string record_id(const nlohmann::json& record, const RecordLocation& where) {
    if (auto it = record.find("id"); it != record.end()) {
        if (it->is_string()) return it->get<std::string>();
        if (it->is_number_integer()) return std::to_string(it->get<long>());
    }
    return fmt::format("{}:{}", where.Dataset, where.Line);
}

bool has_string(const nlohmann::json& record, const char* key) {
    auto it = record.find(key);
    return it != record.end() && it->is_string();
}

std::string require_string(const nlohmann::json& record, const char* key, const RecordLocation& where) {
    if (!has_string(record, key)) {
        throw DataError(fmt::format("{}:{} (id {}): missing string field `{}`", where.File, where.Line,
                                    record_id(record, where), key));
    }
    return record.at(key).get<std::string>();
}

/**
 * @brief Stream over the records of one split, parsing them only when they are consumed.
 *
 * Must not outlive the source that created it.
 */
class JsonlExampleStream : public IExampleStream {
public:
    JsonlExampleStream(const JsonlExampleSource& source, std::vector<RawRecord> records, std::vector<std::size_t> order)
        : mSource(source), mRecords(std::move(records)), mOrder(std::move(order)) {}

    std::optional<Example> next() override {
        while (mPending.empty() && mCursor < mOrder.size()) {
            const RawRecord& raw = mRecords[mOrder[mCursor++]];
            nlohmann::json record;
            try {
                record = nlohmann::json::parse(raw.Text);
            } catch (const nlohmann::json::parse_error& e) {
                throw DataError(fmt::format("{}:{}: invalid json: {}", raw.Where.File, raw.Where.Line, e.what()));
            }
            if (!record.is_object()) {
                throw DataError(fmt::format("{}:{}: record is not a json object", raw.Where.File, raw.Where.Line));
            }
            std::vector<Example> converted;
            mSource.convert(record, raw.Where, converted);
            mPending.insert(mPending.end(), std::make_move_iterator(converted.begin()), std::make_move_iterator(converted.end()));
        }
        if (mPending.empty()) {
            return std::nullopt;
        }
        Example ex = std::move(mPending.front());
        mPending.pop_front();
        ++mPosition;
        return ex;
    }

    [[nodiscard]] long position() const override { return mPosition; }

private:
    const JsonlExampleSource& mSource;
    std::vector<RawRecord> mRecords;
    std::vector<std::size_t> mOrder;
    std::size_t mCursor = 0;
    std::deque<Example> mPending;
    long mPosition = 0;
};

} // namespace

std::string dataset_file(const std::string& data_dir, const std::string& dataset, const std::string& split) {
    if (dataset.ends_with(".jsonl")) {
        return replace(dataset, "{split}", split);
    }
    return (std::filesystem::path(data_dir) / dataset / (split + ".jsonl")).string();
}

JsonlExampleSource::JsonlExampleSource(ExampleSourceOptions options) : mOptions(std::move(options)) {
    if (mOptions.Datasets.empty()) {
        throw ConfigError("Empty list of datasets provided");
    }
}

/**
 * @brief Read all records of `split` and fix their order for `epoch`.
 *
 * Records are kept as raw text; parsing happens when the stream reaches them.
 *
 * @throws DataError if a dataset file for the split does not exist.
 */
std::unique_ptr<IExampleStream> JsonlExampleSource::open(const std::string& split, int epoch) const {
    std::vector<RawRecord> records;
    for (const auto& dataset : mOptions.Datasets) {
        std::string file_name = dataset_file(mOptions.DataDir, dataset, split);
        std::ifstream file(file_name);
        if (!file.is_open()) {
            throw DataError(fmt::format("Could not open dataset file {} (dataset `{}`, split `{}`)", file_name, dataset, split));
        }
        std::string line;
        long line_no = 0;
        while (std::getline(file, line)) {
            ++line_no;
            if (line.find_first_not_of(" \t\r") == std::string::npos) {
                continue;
            }
            records.push_back(RawRecord{{dataset, file_name, line_no}, std::move(line)});
        }
    }

    std::vector<std::size_t> order(records.size());
    std::iota(order.begin(), order.end(), 0);
    if (split == "train") {
        Philox4x32 rng{mOptions.Seed};
        auto s = rng.generate(static_cast<std::uint32_t>(epoch), 0x64617461);
        std::ranges::shuffle(order, std::default_random_engine{s[0]});
    }
    return std::make_unique<JsonlExampleStream>(*this, std::move(records), std::move(order));
}

void SFTExampleSource::convert(const nlohmann::json& record, const RecordLocation& where, std::vector<Example>& out) const {
    Example ex;
    ex.Id = record_id(record, where);
    ex.Dataset = where.Dataset;
    ex.Prompt = require_string(record, "prompt", where);
    if (has_string(record, "completion")) {
        // unpaired records only provide a target when they are desirable
        if (auto label = record.find("label"); label != record.end() && label->is_boolean() && !label->get<bool>()) {
            return;
        }
        ex.Chosen = record.at("completion").get<std::string>();
    } else {
        ex.Chosen = require_string(record, "chosen", where);
    }
    ex.PairKey = ex.Id;
    out.push_back(std::move(ex));
}

void PairedExampleSource::convert(const nlohmann::json& record, const RecordLocation& where, std::vector<Example>& out) const {
    Example ex;
    ex.Id = record_id(record, where);
    ex.Dataset = where.Dataset;
    ex.Prompt = require_string(record, "prompt", where);
    ex.Chosen = require_string(record, "chosen", where);
    ex.Rejected = require_string(record, "rejected", where);
    ex.PairKey = ex.Id;
    out.push_back(std::move(ex));
}

void UnpairedExampleSource::convert(const nlohmann::json& record, const RecordLocation& where, std::vector<Example>& out) const {
    std::string id = record_id(record, where);
    std::string prompt = require_string(record, "prompt", where);

    if (has_string(record, "completion")) {
        auto label = record.find("label");
        if (label == record.end() || !label->is_boolean()) {
            throw DataError(fmt::format("{}:{} (id {}): missing boolean field `label`", where.File, where.Line, id));
        }
        out.push_back(Example{.Id = id, .PairKey = id, .Dataset = where.Dataset, .Prompt = std::move(prompt),
                              .Chosen = record.at("completion").get<std::string>(), .Desirable = label->get<bool>()});
        return;
    }

    // paired record: chosen becomes desirable, rejected undesirable; both keep the record id as pair key
    std::string chosen = require_string(record, "chosen", where);
    std::string rejected = require_string(record, "rejected", where);
    out.push_back(Example{.Id = id + "/chosen", .PairKey = id, .Dataset = where.Dataset, .Prompt = prompt,
                          .Chosen = std::move(chosen), .Desirable = true});
    out.push_back(Example{.Id = id + "/rejected", .PairKey = id, .Dataset = where.Dataset, .Prompt = std::move(prompt),
                          .Chosen = std::move(rejected), .Desirable = false});
}

std::unique_ptr<IExampleSource> make_example_source(EExampleShape shape, ExampleSourceOptions options) {
    switch (shape) {
        case EExampleShape::SFT: return std::make_unique<SFTExampleSource>(std::move(options));
        case EExampleShape::PAIRED: return std::make_unique<PairedExampleSource>(std::move(options));
        case EExampleShape::UNPAIRED: return std::make_unique<UnpairedExampleSource>(std::move(options));
    }
    throw std::logic_error("invalid example shape");
}
