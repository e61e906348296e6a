#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

#include "word_lists.hpp"

namespace hrid {

struct GeneratorConfig {
    std::vector<std::string> elements = {"adjective", "noun", "verb", "adverb"};
    std::string delimiter = "-";

    // nullptr selects standard_word_lists(). The catalog only has to outlive
    // the Generator constructor: the categories in use are copied.
    const Catalog* word_lists = nullptr;

    // When set, every generate() sequence from this instance is reproducible.
    std::optional<uint64_t> seed;

    // encode()/decode() only. Spreads consecutive integers across the id space.
    bool scramble = true;
    std::optional<std::string> scramble_seed;
};

// Builds identifiers like "calm-apple-hop-quietly" by drawing one candidate
// per configured element.
//
// A Generator owns its random engine and is not thread-safe; give each thread
// its own instance. The catalogs themselves are immutable and can be shared.
class Generator {
public:
    // Throws invalid_catalog if any category of the catalog is empty, then
    // unknown_element for the first element missing from the catalog.
    explicit Generator(GeneratorConfig config = {});

    // Draws independently (with replacement) for every element and joins the
    // results with the delimiter. Never fails.
    std::string generate();

    const std::vector<std::string>& elements() const { return element_names_; }
    const std::string& delimiter() const { return delimiter_; }

    // Number of distinct identifiers (product of category sizes). Only
    // meaningful when encodable() is true.
    bool encodable() const { return encodable_; }
    uint64_t space_size() const { return space_size_; }
    uint64_t max_value() const { return space_size_ - 1; }

    // Maps n in [0, space_size()) to an identifier without touching the
    // random engine. Returns empty string on success; otherwise an error.
    std::string encode(uint64_t n, std::string& out_id) const;

    // Inverse of encode(). Returns empty string on success; otherwise an error.
    std::string decode(const std::string& id, uint64_t& out_n) const;

private:
    std::vector<std::string> element_names_;
    std::vector<Category> elements_;
    std::string delimiter_;
    std::mt19937_64 rng_;

    bool encodable_ = false;
    uint64_t space_size_ = 0;
    bool scramble_ = true;
    uint64_t multiplier_ = 1;
    uint64_t inverse_ = 1;
};

}  // namespace hrid
