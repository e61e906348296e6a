#include "generator.hpp"

#include <chrono>
#include <limits>
#include <numeric>
#include <utility>

namespace hrid {

// Largest id space encode()/decode() handle; keeps the modular arithmetic
// below inside int64_t.
static constexpr uint64_t kMaxSpace = static_cast<uint64_t>(std::numeric_limits<int64_t>::max()) / 2;

// Tried in order when no scramble seed is given.
static constexpr uint64_t kScrambleCandidates[] = {2654435769ULL, 1640531527ULL, 2166136261ULL, 16777619ULL};

static std::mt19937_64 seeded_rng(const std::optional<uint64_t>& seed) {
    if (seed) return std::mt19937_64(*seed);

    // Mix clock + random_device to avoid identical sequences on fast repeats.
    std::random_device rd;
    auto now = static_cast<unsigned>(
        std::chrono::high_resolution_clock::now().time_since_epoch().count());
    std::seed_seq seq{rd(), rd(), rd(), now, now ^ 0x9e3779b9U};
    return std::mt19937_64(seq);
}

static uint64_t fnv1a(const std::string& s) {
    uint64_t h = 1469598103934665603ULL;
    for (unsigned char c : s) {
        h ^= static_cast<uint64_t>(c);
        h *= 1099511628211ULL;
    }
    return h;
}

// (a * b) mod m without overflow for m <= kMaxSpace.
static uint64_t mul_mod(uint64_t a, uint64_t b, uint64_t m) {
    a %= m;
    b %= m;
    uint64_t out = 0;
    while (b != 0) {
        if (b & 1) out = (out + a) % m;
        a = (a * 2) % m;
        b >>= 1;
    }
    return out;
}

static uint64_t mod_inverse(uint64_t a, uint64_t m) {
    int64_t old_r = static_cast<int64_t>(a % m);
    int64_t r = static_cast<int64_t>(m);
    int64_t old_s = 1;
    int64_t s = 0;
    while (r != 0) {
        const int64_t q = old_r / r;
        int64_t tmp = old_r - q * r;
        old_r = r;
        r = tmp;
        tmp = old_s - q * s;
        old_s = s;
        s = tmp;
    }
    int64_t x = old_s % static_cast<int64_t>(m);
    if (x < 0) x += static_cast<int64_t>(m);
    return static_cast<uint64_t>(x);
}

static uint64_t find_coprime(uint64_t n, const std::optional<std::string>& seed) {
    if (n <= 1) return 1;

    if (seed) {
        std::mt19937_64 rng(fnv1a(*seed));
        std::uniform_int_distribution<uint64_t> dist(n / 3, n - 1);
        for (int i = 0; i < 1000; i++) {
            const uint64_t candidate = dist(rng);
            if (std::gcd(candidate, n) == 1) return candidate;
        }
    }

    for (uint64_t c : kScrambleCandidates) {
        if (std::gcd(c, n) == 1) return c;
    }
    for (uint64_t c = n / 2; c < n; c++) {
        if (std::gcd(c, n) == 1) return c;
    }
    return 1;
}

static std::vector<std::string> split_on(const std::string& s, const std::string& delim) {
    if (delim.empty()) return {s};

    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        const size_t pos = s.find(delim, start);
        if (pos == std::string::npos) {
            parts.push_back(s.substr(start));
            break;
        }
        parts.push_back(s.substr(start, pos - start));
        start = pos + delim.size();
    }
    return parts;
}

Generator::Generator(GeneratorConfig config)
    : delimiter_(std::move(config.delimiter)), rng_(seeded_rng(config.seed)), scramble_(config.scramble) {
    const Catalog& catalog = config.word_lists ? *config.word_lists : standard_word_lists();
    validate_catalog(catalog);

    element_names_.reserve(config.elements.size());
    elements_.reserve(config.elements.size());
    for (auto& name : config.elements) {
        elements_.push_back(find_category(catalog, name));
        element_names_.push_back(std::move(name));
    }

    encodable_ = true;
    space_size_ = 1;
    for (const auto& c : elements_) {
        const uint64_t n = c.size();
        if (space_size_ > kMaxSpace / n) {
            encodable_ = false;
            space_size_ = 0;
            break;
        }
        space_size_ *= n;
    }

    if (encodable_) {
        multiplier_ = find_coprime(space_size_, config.scramble_seed);
        inverse_ = mod_inverse(multiplier_, space_size_);
    }
}

std::string Generator::generate() {
    std::string out;
    for (size_t i = 0; i < elements_.size(); i++) {
        const Category& c = elements_[i];
        std::uniform_int_distribution<size_t> dist(0, c.size() - 1);
        if (i) out += delimiter_;
        out += c.at(dist(rng_));
    }
    return out;
}

std::string Generator::encode(uint64_t n, std::string& out_id) const {
    if (!encodable_) return "identifier space is too large to encode";
    if (n >= space_size_) {
        return "value " + std::to_string(n) + " out of range, must be 0 <= n < " + std::to_string(space_size_);
    }

    if (scramble_) n = mul_mod(n, multiplier_, space_size_);

    // Last element is the least significant digit.
    std::vector<std::string> parts(elements_.size());
    for (size_t i = elements_.size(); i-- > 0;) {
        const uint64_t base = elements_[i].size();
        parts[i] = elements_[i].at(static_cast<size_t>(n % base));
        n /= base;
    }

    std::string out;
    for (size_t i = 0; i < parts.size(); i++) {
        if (i) out += delimiter_;
        out += parts[i];
    }
    out_id = std::move(out);
    return "";
}

std::string Generator::decode(const std::string& id, uint64_t& out_n) const {
    if (!encodable_) return "identifier space is too large to decode";

    const auto parts = split_on(id, delimiter_);
    if (parts.size() != elements_.size()) {
        return "expected " + std::to_string(elements_.size()) + " parts, got " + std::to_string(parts.size());
    }

    uint64_t n = 0;
    for (size_t i = 0; i < parts.size(); i++) {
        size_t idx = 0;
        if (!elements_[i].index_of(parts[i], idx)) {
            return "word '" + parts[i] + "' not found in word list '" + element_names_[i] + "'";
        }
        n = n * elements_[i].size() + idx;
    }

    if (scramble_) n = mul_mod(n, inverse_, space_size_);

    out_n = n;
    return "";
}

}  // namespace hrid
