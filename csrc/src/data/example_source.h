// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef HALO_SRC_DATA_EXAMPLE_SOURCE_H
#define HALO_SRC_DATA_EXAMPLE_SOURCE_H

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "data/example.h"

//! \brief Lazy sequence over one epoch of one split.
class IExampleStream {
public:
    virtual ~IExampleStream() = default;
    //! Next example, or std::nullopt at the end of the epoch. @throws DataError for malformed records.
    virtual std::optional<Example> next() = 0;
    //! Number of examples returned so far.
    [[nodiscard]] virtual long position() const = 0;
};

/*!
 * \brief Source of raw examples of one shape, read from JSON-lines dataset files.
 * \details `open(split, epoch)` is restartable: opening the same split and epoch again yields the
 * same sequence. The train split is shuffled by a counter-based RNG keyed on (seed, epoch); other
 * splits are read in file order.
 */
class IExampleSource {
public:
    virtual ~IExampleSource() = default;
    [[nodiscard]] virtual EExampleShape shape() const = 0;
    [[nodiscard]] virtual std::unique_ptr<IExampleStream> open(const std::string& split, int epoch) const = 0;
};

struct ExampleSourceOptions {
    std::vector<std::string> Datasets;
    std::string DataDir;
    std::uint64_t Seed = 0;
};

//! Where a record came from, for error messages.
struct RecordLocation {
    std::string Dataset;
    std::string File;
    long Line = 0;
};

class JsonlExampleSource : public IExampleSource {
public:
    explicit JsonlExampleSource(ExampleSourceOptions options);

    [[nodiscard]] std::unique_ptr<IExampleStream> open(const std::string& split, int epoch) const override;

    //! Appends the examples of one record to `out`. @throws DataError for missing fields.
    virtual void convert(const nlohmann::json& record, const RecordLocation& where, std::vector<Example>& out) const = 0;

    [[nodiscard]] const ExampleSourceOptions& options() const { return mOptions; }

private:
    ExampleSourceOptions mOptions;
};

//! Single-response examples; paired records contribute their chosen response.
class SFTExampleSource : public JsonlExampleSource {
public:
    using JsonlExampleSource::JsonlExampleSource;
    [[nodiscard]] EExampleShape shape() const override { return EExampleShape::SFT; }
    void convert(const nlohmann::json& record, const RecordLocation& where, std::vector<Example>& out) const override;
};

class PairedExampleSource : public JsonlExampleSource {
public:
    using JsonlExampleSource::JsonlExampleSource;
    [[nodiscard]] EExampleShape shape() const override { return EExampleShape::PAIRED; }
    void convert(const nlohmann::json& record, const RecordLocation& where, std::vector<Example>& out) const override;
};

//! Labelled single responses; paired records are split into a desirable and an undesirable example.
class UnpairedExampleSource : public JsonlExampleSource {
public:
    using JsonlExampleSource::JsonlExampleSource;
    [[nodiscard]] EExampleShape shape() const override { return EExampleShape::UNPAIRED; }
    void convert(const nlohmann::json& record, const RecordLocation& where, std::vector<Example>& out) const override;
};

std::unique_ptr<IExampleSource> make_example_source(EExampleShape shape, ExampleSourceOptions options);

//! `<data_dir>/<dataset>/<split>.jsonl`, or `dataset` with `{split}` substituted if it names a .jsonl file.
std::string dataset_file(const std::string& data_dir, const std::string& dataset, const std::string& split);

#endif //HALO_SRC_DATA_EXAMPLE_SOURCE_H
