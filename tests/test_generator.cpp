#include <gtest/gtest.h>

#include <set>
#include <string>
#include <vector>

#include "generator.hpp"

using hrid::Generator;
using hrid::GeneratorConfig;

namespace {

std::vector<std::string> split(const std::string& s, const std::string& delim) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        const size_t pos = s.find(delim, start);
        if (pos == std::string::npos) {
            parts.push_back(s.substr(start));
            return parts;
        }
        parts.push_back(s.substr(start, pos - start));
        start = pos + delim.size();
    }
}

std::vector<std::string> draw(Generator& gen, int count) {
    std::vector<std::string> out;
    for (int i = 0; i < count; i++) out.push_back(gen.generate());
    return out;
}

GeneratorConfig seeded(uint64_t seed) {
    GeneratorConfig config;
    config.seed = seed;
    return config;
}

}  // namespace

TEST(generator, default_output_has_four_known_segments) {
    Generator gen;
    const auto& lists = hrid::standard_word_lists();
    const std::vector<std::string> order = {"adjective", "noun", "verb", "adverb"};
    EXPECT_EQ(gen.elements(), order);
    EXPECT_EQ(gen.delimiter(), "-");

    for (int i = 0; i < 200; i++) {
        const std::string id = gen.generate();
        const auto parts = split(id, "-");
        ASSERT_EQ(parts.size(), 4u) << id;
        for (size_t p = 0; p < parts.size(); p++) {
            EXPECT_FALSE(parts[p].empty()) << id;
            EXPECT_TRUE(lists.at(order[p]).contains(parts[p])) << "'" << parts[p] << "' is not a " << order[p];
        }
    }
}

TEST(generator, number_segments_stay_in_range) {
    GeneratorConfig config = seeded(7);
    config.elements = {"number"};
    Generator gen(config);

    std::set<int> seen;
    for (int i = 0; i < 3000; i++) {
        const std::string s = gen.generate();
        const int n = std::stoi(s);
        EXPECT_EQ(std::to_string(n), s);
        EXPECT_GE(n, 10);
        EXPECT_LE(n, 99);
        seen.insert(n);
    }
    // Both ends of the range are reachable.
    EXPECT_EQ(seen.count(10), 1u);
    EXPECT_EQ(seen.count(99), 1u);
}

TEST(generator, same_seed_same_sequence) {
    Generator a(seeded(12345));
    Generator b(seeded(12345));
    for (int i = 0; i < 50; i++) EXPECT_EQ(a.generate(), b.generate()) << "diverged at call " << i;
}

TEST(generator, seed_42_is_reproducible) {
    Generator a(seeded(42));
    Generator b(seeded(42));
    const std::string first = a.generate();
    EXPECT_EQ(first, b.generate());
    EXPECT_EQ(split(first, "-").size(), 4u);
}

TEST(generator, different_seeds_differ) {
    Generator a(seeded(12345));
    Generator b(seeded(54321));
    EXPECT_NE(draw(a, 10), draw(b, 10));
}

TEST(generator, seeded_calls_advance) {
    Generator gen(seeded(1));
    const auto ids = draw(gen, 20);
    const std::set<std::string> distinct(ids.begin(), ids.end());
    EXPECT_GT(distinct.size(), 1u);
}

TEST(generator, unseeded_instances_are_independent) {
    Generator a;
    Generator b;
    EXPECT_NE(draw(a, 20), draw(b, 20));
}

TEST(generator, seed_with_nice_word_lists) {
    GeneratorConfig config = seeded(999);
    config.elements = {"weather", "tree"};
    config.word_lists = &hrid::nice_word_lists();
    Generator a(config);
    Generator b(config);
    const std::string id = a.generate();
    EXPECT_EQ(id, b.generate());

    const auto parts = split(id, "-");
    ASSERT_EQ(parts.size(), 2u);
    EXPECT_TRUE(hrid::nice_word_lists().at("weather").contains(parts[0]));
    EXPECT_TRUE(hrid::nice_word_lists().at("tree").contains(parts[1]));
}

TEST(generator, custom_word_lists) {
    const hrid::Catalog lists = hrid::make_catalog({
        {"color", {"red", "blue", "green"}},
        {"size", {"big", "small", "tiny"}},
        {"animal", {"cat", "dog", "bird"}},
    });
    GeneratorConfig config;
    config.elements = {"color", "size", "animal"};
    config.word_lists = &lists;
    Generator gen(config);

    std::set<std::string> combos;
    for (const char* c : {"red", "blue", "green"}) {
        for (const char* s : {"big", "small", "tiny"}) {
            for (const char* a : {"cat", "dog", "bird"}) combos.insert(std::string(c) + "-" + s + "-" + a);
        }
    }
    ASSERT_EQ(combos.size(), 27u);

    for (int i = 0; i < 300; i++) {
        const std::string id = gen.generate();
        EXPECT_EQ(combos.count(id), 1u) << id;
    }
}

TEST(generator, catalog_only_needs_to_outlive_construction) {
    GeneratorConfig config = seeded(3);
    config.elements = {"greeting"};
    Generator gen = [&]() {
        const hrid::Catalog lists = hrid::make_catalog({{"greeting", {"hello", "hi", "hey"}}});
        config.word_lists = &lists;
        return Generator(config);
    }();
    const std::string id = gen.generate();
    EXPECT_TRUE(id == "hello" || id == "hi" || id == "hey") << id;
}

TEST(generator, delimiter_variants) {
    GeneratorConfig config = seeded(5);
    config.elements = {"number", "number", "number"};

    config.delimiter = ", ";
    EXPECT_EQ(split(Generator(config).generate(), ", ").size(), 3u);

    config.delimiter = "";
    const std::string packed = Generator(config).generate();
    EXPECT_EQ(packed.size(), 6u);
    for (char c : packed) EXPECT_TRUE(c >= '0' && c <= '9') << packed;
}

TEST(generator, no_elements_gives_empty_string) {
    GeneratorConfig config;
    config.elements = {};
    Generator gen(config);
    EXPECT_EQ(gen.generate(), "");
}

TEST(generator, repeated_elements_are_drawn_independently) {
    GeneratorConfig config = seeded(11);
    config.elements = {"adjective", "adjective"};
    Generator gen(config);

    bool saw_different = false;
    for (int i = 0; i < 50 && !saw_different; i++) {
        const auto parts = split(gen.generate(), "-");
        saw_different = parts[0] != parts[1];
    }
    EXPECT_TRUE(saw_different);
}

TEST(generator, unknown_element_fails_at_construction) {
    GeneratorConfig config;
    config.elements = {"not_a_real_category"};
    EXPECT_THROW(Generator{config}, hrid::unknown_element);

    config.elements = {"adjective", "bogus", "nope"};
    try {
        Generator gen(config);
        FAIL() << "Expected unknown_element";
    } catch (const hrid::unknown_element& e) {
        EXPECT_EQ(e.name(), "bogus");
        EXPECT_NE(std::string(e.what()).find("bogus"), std::string::npos);
    }
}

TEST(generator, nice_only_category_is_unknown_in_standard) {
    GeneratorConfig config;
    config.elements = {"place"};
    EXPECT_THROW(Generator{config}, hrid::unknown_element);

    config.word_lists = &hrid::nice_word_lists();
    EXPECT_NO_THROW(Generator{config});
}

TEST(generator, empty_custom_category_fails_at_construction) {
    const hrid::Catalog lists = hrid::make_catalog({{"color", {}}, {"size", {"big"}}});
    GeneratorConfig config;
    config.elements = {"color", "size"};
    config.word_lists = &lists;
    try {
        Generator gen(config);
        FAIL() << "Expected invalid_catalog";
    } catch (const hrid::invalid_catalog& e) {
        EXPECT_EQ(e.category(), "color");
    }
}

TEST(generator, interleaved_instances_keep_their_own_sequence) {
    Generator a(seeded(77));
    Generator b(seeded(77));
    Generator other(seeded(78));

    std::vector<std::string> from_a;
    for (int i = 0; i < 10; i++) {
        from_a.push_back(a.generate());
        other.generate();
    }
    EXPECT_EQ(from_a, draw(b, 10));
}
