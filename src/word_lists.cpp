#include "word_lists.hpp"

#include <algorithm>
#include <exception>
#include <utility>

namespace hrid {

static const std::vector<std::string>& adjectives() {
    static const std::vector<std::string> v = {
        "able", "adorable", "aggressive", "agile", "alert", "amazing", "ancient", "angry", "anxious", "awesome",
        "bad", "bald", "bashful", "big", "bitter", "blue", "bold", "brave", "bright", "brisk",
        "broken", "bumpy", "busy", "calm", "careful", "charming", "cheerful", "chilly", "clean", "clever",
        "clumsy", "cold", "cool", "cozy", "crazy", "creepy", "crisp", "cruel", "curious", "cute",
        "damp", "dark", "dead", "depressed", "dirty", "dizzy", "dull", "dusty", "eager", "early",
        "easy", "elegant", "empty", "evil", "fair", "faithful", "famous", "fancy", "fast", "fat",
        "fierce", "filthy", "fine", "fluffy", "foolish", "fragile", "fresh", "friendly", "funny", "fuzzy",
        "gentle", "giant", "gifted", "glad", "glorious", "golden", "good", "gorgeous", "graceful", "greasy",
        "great", "green", "grumpy", "happy", "heavy", "helpful", "hollow", "honest", "hopeless", "hostile",
        "huge", "humble", "hungry", "icy", "idle", "jolly", "juicy", "kind", "large", "lazy",
        "light", "little", "lively", "lonely", "loud", "lucky", "mad", "magic", "merry", "mighty",
        "miserable", "modern", "nasty", "neat", "nervous", "new", "nice", "noble", "odd", "old",
        "orange", "plain", "polite", "proud", "purple", "quick", "quiet", "rapid", "rare", "red",
        "rich", "rotten", "rude", "sad", "safe", "salty", "shiny", "shy", "silent", "silly",
        "sleepy", "slimy", "slow", "small", "smart", "smelly", "smooth", "soft", "solid", "sour",
        "spicy", "stale", "steady", "stupid", "sturdy", "sunny", "super", "sweet", "swift", "tall",
        "tame", "tender", "thick", "thin", "tidy", "tiny", "tough", "ugly", "vast", "violent",
        "warm", "weak", "weird", "wicked", "wild", "wise", "witty", "worthless", "young", "zany",
        "zealous"};
    return v;
}

static const std::vector<std::string>& nouns() {
    static const std::vector<std::string> v = {
        "anchor", "apple", "arrow", "atlas", "bagel", "balloon", "banana", "banjo", "basket", "beacon",
        "bell", "bench", "bicycle", "blanket", "boat", "bomb", "book", "boot", "bottle", "bread",
        "bridge", "brush", "bucket", "butter", "button", "cabin", "cake", "camera", "candle", "canoe",
        "carpet", "castle", "chair", "cheese", "cherry", "chimney", "clock", "cloud", "coffin", "coin",
        "comet", "cookie", "crayon", "crown", "cup", "curtain", "desk", "diamond", "door", "dragon",
        "drum", "engine", "feather", "fiddle", "flag", "flute", "fork", "fountain", "garbage", "garden",
        "gate", "gem", "glove", "guitar", "hammer", "harbor", "hat", "helmet", "honey", "island",
        "jacket", "jar", "jelly", "kettle", "key", "kite", "ladder", "lamp", "lantern", "lemon",
        "letter", "magnet", "mango", "map", "marble", "mirror", "mitten", "moon", "mountain", "muffin",
        "needle", "nest", "noodle", "ocean", "paddle", "pancake", "paper", "pebble", "pencil", "pepper",
        "piano", "pickle", "pillow", "planet", "plum", "pocket", "potato", "pumpkin", "puzzle", "quilt",
        "radio", "river", "rocket", "saddle", "sandwich", "scarf", "shell", "shovel", "skull", "sock",
        "spoon", "star", "stone", "sugar", "table", "teapot", "ticket", "toast", "toilet", "tomato",
        "tower", "trumpet", "tunnel", "umbrella", "vase", "violin", "wagon", "wallet", "whistle", "window",
        "wizard", "yarn", "yogurt", "zipper"};
    return v;
}

static const std::vector<std::string>& verbs() {
    static const std::vector<std::string> v = {
        "accept", "add", "admire", "agree", "allow", "appear", "arrive", "ask", "attack", "bake",
        "bang", "bathe", "beg", "behave", "bite", "blink", "bless", "boil", "bounce", "bow",
        "breathe", "build", "bump", "burn", "buzz", "call", "camp", "care", "carry", "change",
        "chase", "cheat", "cheer", "chew", "clap", "clean", "climb", "collect", "cook", "cough",
        "count", "crawl", "cross", "cry", "curl", "dance", "dare", "decide", "dig", "dive",
        "doze", "drag", "draw", "dream", "drink", "drive", "drop", "dry", "eat", "enjoy",
        "explain", "explode", "fetch", "fight", "fill", "float", "flow", "fly", "fold", "follow",
        "fry", "gather", "glow", "grab", "grin", "grow", "guess", "hang", "heal", "help",
        "hide", "hop", "hug", "hum", "hunt", "hurry", "jog", "joke", "juggle", "jump",
        "kick", "kill", "kiss", "kneel", "knit", "knock", "laugh", "lean", "learn", "lick",
        "lift", "listen", "march", "melt", "mix", "move", "nap", "nod", "obey", "paint",
        "pause", "pedal", "play", "poke", "pray", "punch", "push", "race", "rest", "ride",
        "ring", "roar", "roll", "run", "sail", "scream", "sew", "shake", "shout", "sing",
        "sit", "skate", "ski", "skip", "sleep", "slide", "smash", "smile", "sneeze", "sniff",
        "spin", "spit", "splash", "stab", "stare", "steal", "stir", "stomp", "swim", "swing",
        "talk", "tap", "think", "throw", "tickle", "trip", "twirl", "vanish", "wait", "walk",
        "wander", "wash", "wave", "whistle", "wink", "wish", "wobble", "work", "yawn", "yell",
        "zoom"};
    return v;
}

static const std::vector<std::string>& adverbs() {
    static const std::vector<std::string> v = {
        "abruptly", "absently", "angrily", "anxiously", "awkwardly", "badly", "blindly", "boldly", "bravely", "briefly",
        "brightly", "briskly", "busily", "calmly", "carefully", "cheerfully", "clearly", "closely", "cruelly", "curiously",
        "daintily", "deftly", "eagerly", "easily", "elegantly", "evenly", "evilly", "fairly", "faithfully", "fiercely",
        "fondly", "foolishly", "freely", "gently", "gladly", "gracefully", "greedily", "happily", "hastily", "honestly",
        "hungrily", "innocently", "jovially", "joyfully", "kindly", "lazily", "lightly", "loudly", "lovingly", "loyally",
        "madly", "merrily", "miserably", "neatly", "nervously", "nicely", "noisily", "oddly", "openly", "patiently",
        "playfully", "politely", "proudly", "quickly", "quietly", "rapidly", "rarely", "readily", "rudely", "sadly",
        "safely", "selfishly", "sharply", "shyly", "silently", "sleepily", "slowly", "smoothly", "softly", "solemnly",
        "speedily", "steadily", "sternly", "swiftly", "tenderly", "thankfully", "tightly", "truly", "vaguely", "violently",
        "warmly", "wearily", "wildly", "wisely", "wrongly", "zealously"};
    return v;
}

static const std::vector<std::string>& animals() {
    static const std::vector<std::string> v = {
        "ant", "badger", "bat", "bear", "beaver", "bee", "bison", "boar", "buffalo", "camel",
        "cat", "cheetah", "chicken", "cobra", "cow", "crab", "crane", "crow", "deer", "dingo",
        "dog", "dolphin", "donkey", "dove", "duck", "eagle", "eel", "elk", "falcon", "ferret",
        "finch", "fox", "frog", "gazelle", "gecko", "gerbil", "giraffe", "goat", "goose", "gorilla",
        "hamster", "hare", "hawk", "hedgehog", "heron", "hippo", "horse", "hyena", "ibis", "iguana",
        "jackal", "jaguar", "kangaroo", "koala", "lemur", "leopard", "lion", "lizard", "llama", "lobster",
        "lynx", "mole", "mongoose", "monkey", "moose", "mouse", "mule", "newt", "octopus", "otter",
        "owl", "ox", "panda", "panther", "parrot", "pelican", "penguin", "pig", "pigeon", "pony",
        "puffin", "puma", "quail", "rabbit", "raccoon", "rat", "raven", "rhino", "robin", "salmon",
        "seal", "shark", "sheep", "skunk", "sloth", "snail", "snake", "sparrow", "spider", "squid",
        "squirrel", "stork", "swan", "tiger", "toad", "trout", "turkey", "turtle", "walrus", "wasp",
        "weasel", "whale", "wolf", "wombat", "yak", "zebra"};
    return v;
}

static const std::vector<std::string>& flowers() {
    static const std::vector<std::string> v = {
        "aster", "azalea", "begonia", "bluebell", "buttercup", "camellia", "carnation", "clover", "crocus", "daffodil",
        "dahlia", "daisy", "foxglove", "freesia", "gardenia", "geranium", "hibiscus", "hyacinth", "iris", "jasmine",
        "lavender", "lilac", "lily", "lotus", "magnolia", "marigold", "orchid", "pansy", "peony", "petunia",
        "poppy", "primrose", "rose", "snapdragon", "sunflower", "tulip", "violet", "zinnia"};
    return v;
}

unknown_element::unknown_element(const std::string& name)
    : std::invalid_argument("unknown element '" + name + "'"), name_(name) {}

invalid_catalog::invalid_catalog(const std::string& category, const std::string& what)
    : std::invalid_argument(what), category_(category) {}

Category Category::from_words(std::vector<std::string> words) {
    Category c;
    c.kind = Kind::Words;
    c.words = std::move(words);
    return c;
}

Category Category::from_range(int lo, int hi) {
    Category c;
    c.kind = Kind::Range;
    c.lo = lo;
    c.hi = hi;
    return c;
}

size_t Category::size() const {
    if (kind == Kind::Words) return words.size();
    if (hi < lo) return 0;
    return static_cast<size_t>(static_cast<int64_t>(hi) - static_cast<int64_t>(lo) + 1);
}

std::string Category::at(size_t idx) const {
    if (kind == Kind::Words) return words[idx];
    return std::to_string(static_cast<int64_t>(lo) + static_cast<int64_t>(idx));
}

bool Category::index_of(const std::string& word, size_t& out_idx) const {
    if (kind == Kind::Words) {
        auto it = std::find(words.begin(), words.end(), word);
        if (it == words.end()) return false;
        out_idx = static_cast<size_t>(it - words.begin());
        return true;
    }

    long long value = 0;
    try {
        value = std::stoll(word);
    } catch (const std::exception&) {
        return false;
    }
    // Only the canonical rendering counts ("07", "+7" and " 7" do not).
    if (std::to_string(value) != word) return false;
    if (value < lo || value > hi) return false;
    out_idx = static_cast<size_t>(value - lo);
    return true;
}

bool Category::contains(const std::string& word) const {
    size_t idx = 0;
    return index_of(word, idx);
}

const Catalog& standard_word_lists() {
    static const Catalog lists = []() {
        Catalog c;
        c["adjective"] = Category::from_words(adjectives());
        c["noun"] = Category::from_words(nouns());
        c["verb"] = Category::from_words(verbs());
        c["adverb"] = Category::from_words(adverbs());
        c["animal"] = Category::from_words(animals());
        c["flower"] = Category::from_words(flowers());
        c["number"] = Category::from_range(kNumberMin, kNumberMax);
        return c;
    }();
    return lists;
}

Catalog make_catalog(const WordLists& lists) {
    Catalog out;
    for (const auto& [name, words] : lists) out[name] = Category::from_words(words);
    return out;
}

const Category& find_category(const Catalog& catalog, const std::string& name) {
    auto it = catalog.find(name);
    if (it == catalog.end()) throw unknown_element(name);
    return it->second;
}

void validate_catalog(const Catalog& catalog) {
    for (const auto& [name, category] : catalog) {
        if (category.size() != 0) continue;
        if (category.kind == Category::Kind::Range) {
            throw invalid_catalog(name, "range for '" + name + "' is empty (lo " + std::to_string(category.lo) +
                                            " > hi " + std::to_string(category.hi) + ")");
        }
        throw invalid_catalog(name, "word list '" + name + "' is empty");
    }
}

}  // namespace hrid
