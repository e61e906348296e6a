#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

namespace hrid {

// Inclusive bounds of the built-in "number" category.
constexpr int kNumberMin = 10;
constexpr int kNumberMax = 99;

// One segment of an identifier. A Words category draws from a fixed list;
// a Range category draws an integer from [lo, hi] and renders it in decimal.
struct Category {
    enum class Kind {
        Words,
        Range,
    };

    Kind kind = Kind::Words;
    // Words only; empty for a Range.
    std::vector<std::string> words;
    // Range only; ignored for Words.
    int lo = 0;
    int hi = -1;

    static Category from_words(std::vector<std::string> words);
    static Category from_range(int lo, int hi);

    // Number of candidates; 0 means the category is unusable.
    size_t size() const;

    // Candidate at `idx`. Requires idx < size().
    std::string at(size_t idx) const;

    // Finds the position of `word`. Returns false if it is not a candidate.
    bool index_of(const std::string& word, size_t& out_idx) const;

    bool contains(const std::string& word) const;
};

// Category name -> category. Ordered so iteration is stable.
using Catalog = std::map<std::string, Category>;

// Plain word lists as a caller would write them.
using WordLists = std::map<std::string, std::vector<std::string>>;

// A category name that the catalog in use does not define.
class unknown_element : public std::invalid_argument {
public:
    explicit unknown_element(const std::string& name);

    const std::string& name() const { return name_; }

private:
    std::string name_;
};

class invalid_catalog : public std::invalid_argument {
public:
    invalid_catalog(const std::string& category, const std::string& what);

    const std::string& category() const { return category_; }

private:
    std::string category_;
};

// Built once on first use and never modified afterwards.
// Standard: adjective, noun, verb, adverb, animal, flower, number.
const Catalog& standard_word_lists();

// The standard categories with offensive or awkward words removed, plus
// place, tree, weather, fabric and mood.
const Catalog& nice_word_lists();

// Wraps caller-supplied lists. Content is taken as-is; use validate_catalog()
// (or construct a Generator) to check structure.
Catalog make_catalog(const WordLists& lists);

// Throws invalid_catalog for the first category with no candidates.
void validate_catalog(const Catalog& catalog);

// Throws unknown_element if `name` is not in `catalog`.
const Category& find_category(const Catalog& catalog, const std::string& name);

}  // namespace hrid
