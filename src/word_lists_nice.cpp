#include "word_lists.hpp"

#include <unordered_set>
#include <utility>

namespace hrid {

// Words dropped from every standard category when building the nice lists.
static const std::unordered_set<std::string>& blocked_words() {
    static const std::unordered_set<std::string> s = {
        // adjectives
        "aggressive", "angry", "anxious", "bad", "bald", "bitter", "broken", "clumsy", "crazy", "creepy",
        "cruel", "dead", "depressed", "dirty", "dull", "evil", "fat", "filthy", "foolish", "greasy",
        "grumpy", "hopeless", "hostile", "lazy", "lonely", "mad", "miserable", "nasty", "nervous", "rotten",
        "rude", "sad", "slimy", "smelly", "sour", "stale", "stupid", "thick", "ugly", "violent",
        "weak", "weird", "wicked", "worthless",
        // nouns
        "bomb", "coffin", "garbage", "skull", "toilet",
        // verbs
        "attack", "cheat", "fight", "kill", "punch", "scream", "spit", "stab", "steal",
        // adverbs
        "angrily", "cruelly", "evilly", "foolishly", "greedily", "miserably", "rudely", "selfishly", "violently",
        // animals
        "rat", "skunk", "weasel",
        // flowers
        "pansy"};
    return s;
}

static const std::vector<std::string>& places() {
    static const std::vector<std::string> v = {
        "abbey", "arcade", "bakery", "bay", "beach", "canyon", "castle", "chapel", "cliff", "coast",
        "cottage", "courtyard", "cove", "creek", "delta", "dune", "fjord", "forest", "garden", "glade",
        "glen", "grotto", "grove", "harbor", "haven", "highland", "hill", "island", "lagoon", "lake",
        "library", "lighthouse", "lodge", "marina", "market", "meadow", "mesa", "mill", "oasis", "orchard",
        "palace", "park", "pavilion", "plaza", "pond", "prairie", "reef", "ridge", "riverbank", "savanna",
        "shore", "spring", "summit", "terrace", "tundra", "valley", "villa", "vineyard", "waterfall"};
    return v;
}

static const std::vector<std::string>& trees() {
    static const std::vector<std::string> v = {
        "acacia", "alder", "ash", "aspen", "banyan", "baobab", "beech", "birch", "cedar", "cherry",
        "chestnut", "cypress", "elm", "eucalyptus", "fir", "ginkgo", "hawthorn", "hazel", "hemlock", "hickory",
        "holly", "juniper", "larch", "laurel", "linden", "magnolia", "mahogany", "maple", "oak", "olive",
        "palm", "pine", "poplar", "redwood", "rowan", "sequoia", "spruce", "sycamore", "teak", "walnut",
        "willow", "yew"};
    return v;
}

static const std::vector<std::string>& weather() {
    static const std::vector<std::string> v = {
        "aurora", "breeze", "cloudburst", "dew", "drizzle", "flurry", "fog", "frost", "haze", "mist",
        "monsoon", "rainbow", "rainfall", "shower", "snowfall", "snowflake", "sunbeam", "sunrise", "sunset", "sunshine",
        "thunder", "twilight", "zephyr"};
    return v;
}

static const std::vector<std::string>& fabrics() {
    static const std::vector<std::string> v = {
        "alpaca", "brocade", "burlap", "calico", "canvas", "cashmere", "chambray", "chenille", "chiffon", "corduroy",
        "cotton", "crepe", "damask", "denim", "felt", "flannel", "fleece", "gabardine", "gauze", "gingham",
        "jersey", "khaki", "lace", "linen", "mohair", "muslin", "organza", "percale", "poplin", "satin",
        "seersucker", "silk", "suede", "taffeta", "tulle", "tweed", "twill", "velour", "velvet", "voile",
        "wool"};
    return v;
}

static const std::vector<std::string>& moods() {
    static const std::vector<std::string> v = {
        "amused", "blissful", "bubbly", "calm", "carefree", "cheerful", "cheery", "chipper", "content", "curious",
        "delighted", "dreamy", "eager", "ecstatic", "elated", "excited", "giddy", "glad", "grateful", "happy",
        "hopeful", "inspired", "jolly", "jovial", "joyful", "jubilant", "keen", "lively", "mellow", "merry",
        "optimistic", "peaceful", "playful", "pleased", "proud", "relaxed", "serene", "sunny", "thankful", "thrilled",
        "tranquil", "upbeat", "zesty"};
    return v;
}

const Catalog& nice_word_lists() {
    static const Catalog lists = []() {
        const auto& blocked = blocked_words();

        Catalog c;
        for (const auto& [name, category] : standard_word_lists()) {
            if (category.kind != Category::Kind::Words) {
                c[name] = category;
                continue;
            }
            std::vector<std::string> kept;
            kept.reserve(category.words.size());
            for (const auto& w : category.words) {
                if (blocked.count(w) == 0) kept.push_back(w);
            }
            c[name] = Category::from_words(std::move(kept));
        }

        c["place"] = Category::from_words(places());
        c["tree"] = Category::from_words(trees());
        c["weather"] = Category::from_words(weather());
        c["fabric"] = Category::from_words(fabrics());
        c["mood"] = Category::from_words(moods());
        return c;
    }();
    return lists;
}

}  // namespace hrid
