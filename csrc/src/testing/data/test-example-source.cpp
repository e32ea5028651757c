// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

#include "data/example_source.h"
#include "data/tokenizer.h"
#include "utilities/utils.h"
#include "../utilities/test_utils.h"

using namespace testing_utils;

namespace {

std::vector<Example> read_all(const IExampleSource& source, const std::string& split, int epoch) {
    std::vector<Example> out;
    auto stream = source.open(split, epoch);
    while (auto ex = stream->next()) {
        out.push_back(std::move(*ex));
    }
    return out;
}

std::vector<std::string> ids(const std::vector<Example>& examples) {
    std::vector<std::string> result;
    for (const auto& e : examples) result.push_back(e.Id);
    return result;
}

} // namespace

TEST_CASE("example source: paired records split into a desirable and an undesirable example", "[data]") {
    TempDir dir("source");
    write_dataset(dir, "toy", paired_records(3), paired_records(2));
    auto source = make_example_source(EExampleShape::UNPAIRED, {{"toy"}, dir.str(), 7});

    auto examples = read_all(*source, "test", 0);
    REQUIRE(examples.size() == 4);
    CHECK(examples[0].Id == "p0/chosen");
    CHECK(examples[0].Desirable);
    CHECK(examples[0].Chosen == "good answer 0");
    CHECK(examples[1].Id == "p0/rejected");
    CHECK_FALSE(examples[1].Desirable);
    CHECK(examples[1].Chosen == "bad 0");
    CHECK(examples[0].PairKey == examples[1].PairKey);
}

TEST_CASE("example source: sft keeps only desirable completions", "[data]") {
    TempDir dir("source");
    write_dataset(dir, "toy", unpaired_records(3, 2), unpaired_records(1, 1));
    auto source = make_example_source(EExampleShape::SFT, {{"toy"}, dir.str(), 1});
    auto examples = read_all(*source, "train", 0);
    CHECK(examples.size() == 3);
    for (const auto& e : examples) {
        CHECK(e.Chosen.starts_with("yes"));
    }
}

TEST_CASE("example source: reopening an epoch replays the same order", "[data]") {
    TempDir dir("source");
    write_dataset(dir, "toy", paired_records(testing_config::get_test_config().Examples), paired_records(2));
    auto source = make_example_source(EExampleShape::PAIRED, {{"toy"}, dir.str(), 3});

    auto first = ids(read_all(*source, "train", 0));
    CHECK(first == ids(read_all(*source, "train", 0)));
    CHECK(first != ids(read_all(*source, "train", 1)));

    auto other_seed = make_example_source(EExampleShape::PAIRED, {{"toy"}, dir.str(), 4});
    CHECK(first != ids(read_all(*other_seed, "train", 0)));
}

TEST_CASE("example source: the test split keeps file order", "[data]") {
    TempDir dir("source");
    write_dataset(dir, "toy", paired_records(2), paired_records(5));
    auto source = make_example_source(EExampleShape::PAIRED, {{"toy"}, dir.str(), 3});
    CHECK(ids(read_all(*source, "test", 4)) == std::vector<std::string>{"p0", "p1", "p2", "p3", "p4"});
}

TEST_CASE("example source: datasets given as file patterns", "[data]") {
    TempDir dir("source");
    write_jsonl(dir / "extra/train-file.jsonl", paired_records(2, "x"));
    write_dataset(dir, "toy", paired_records(1), paired_records(1));
    CHECK(dataset_file("d", "a/{split}-file.jsonl", "train") == "a/train-file.jsonl");

    auto source = make_example_source(EExampleShape::PAIRED, {{"toy", dir / "extra/{split}-file.jsonl"}, dir.str(), 3});
    CHECK(read_all(*source, "train", 0).size() == 3);
}

TEST_CASE("example source: malformed records are data errors naming the record", "[data]") {
    TempDir dir("source");
    nlohmann::json broken = {{"id", "broken"}, {"prompt", "q"}, {"chosen", "a"}};
    write_dataset(dir, "toy", {broken}, {});
    auto source = make_example_source(EExampleShape::PAIRED, {{"toy"}, dir.str(), 3});
    auto stream = source->open("train", 0);
    try {
        (void)stream->next();
        FAIL("expected DataError");
    } catch (const DataError& e) {
        CHECK(std::string(e.what()).find("broken") != std::string::npos);
        CHECK(std::string(e.what()).find("rejected") != std::string::npos);
    }
}

TEST_CASE("example source: a missing split is a data error", "[data]") {
    TempDir dir("source");
    auto source = make_example_source(EExampleShape::SFT, {{"nope"}, dir.str(), 3});
    CHECK_THROWS_AS(source->open("train", 0), DataError);
    CHECK_THROWS_AS(make_example_source(EExampleShape::SFT, {{}, dir.str(), 3}), ConfigError);
}

TEST_CASE("tokenizer: prompt is truncated from the left, the sequence from the right", "[data]") {
    ByteTokenizer tok(256, 257);
    auto prompt = tok.encode("abcdef");
    auto response = tok.encode("xyz");
    response.push_back(tok.eos_id());

    TokenizedSequence seq = build_sequence(prompt, response, 6, 3);
    CHECK(seq.PromptLength == 3);
    CHECK(tok.decode(seq.Tokens) == "defxyz");
    REQUIRE(seq.Labels.size() == 6);
    CHECK(seq.Labels[0] == IGNORE_LABEL);
    CHECK(seq.Labels[2] == IGNORE_LABEL);
    CHECK(seq.Labels[3] == 'x');
    CHECK(tok.decode(std::vector<std::int32_t>{'h', 'i', 257, 'x'}) == "hi");
}
