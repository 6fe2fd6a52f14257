#include "speech-text.h"
#include "sim-doubles.h"

#include <random>

using namespace std;

static void sim_segmentation() {
    cout << "--- sentence segmentation ---\n";
    SentenceSegmenter seg;
    vector<string> fragments = {"Hello", " there", ".", " How", " are", " you", "?"};
    vector<string> sentences;
    for (const string& f : fragments) {
        for (const string& s : seg.feed(f)) sentences.push_back(s);
    }
    check(sentences.size() == 2, "two sentences from seven fragments");
    check(sentences.size() == 2 && sentences[0] == "Hello there.", "first sentence is \"Hello there.\"");
    check(sentences.size() == 2 && sentences[1] == "How are you?", "second sentence is trimmed \"How are you?\"");
    check(seg.empty(), "buffer empty after a terminated sentence");

    seg.feed("Trailing words without");
    seg.feed(" an end");
    check(seg.flush() == "Trailing words without an end", "flush returns the unterminated tail");
    check(seg.empty(), "flush clears the buffer");

    check(seg.feed("   ").empty() && seg.feed(" !").size() == 1, "punctuation-only fragment still closes a sentence");
    seg.clear();
    check(ends_sentence("Done!  \n") && !ends_sentence("Not yet,") && !ends_sentence(""), "ends_sentence ignores trailing whitespace");
}

static void sim_sanitize() {
    cout << "--- sanitize ---\n";
    check(sanitize_for_speech("Hello (aside) world") == "Hello  world", "parenthetical removed");
    check(sanitize_for_speech("This is *very* good") == "This is  good", "asterisk emphasis removed");
    check(sanitize_for_speech("an _under_ line") == "an  line", "underscore emphasis removed");
    check(sanitize_for_speech("Yay~~~") == "Yay!", "tilde run collapses to one '!'");
    check(sanitize_for_speech("caf\xc3\xa9 \xf0\x9f\x98\x80 ok") == "caf  ok", "non-ASCII bytes dropped");
    check(sanitize_for_speech("  padded  ") == "padded", "surrounding whitespace trimmed");
    check(sanitize_for_speech("(open\nclose)") == "(open\nclose)", "parenthesis spanning lines kept");
    check(sanitize_for_speech("") == "", "empty input stays empty");
    check(sanitize_for_speech("(*\n*)") == sanitize_for_speech(sanitize_for_speech("(*\n*)")),
          "nested markers reach a fixpoint");

    // Idempotence and totality over random byte strings
    mt19937 rng(2024);
    const string alphabet = "ab (*)_~.!?\n\t\x80\xff";
    bool idempotent = true;
    for (int i = 0; i < 2000 && idempotent; ++i) {
        string s;
        size_t len = rng() % 40;
        for (size_t k = 0; k < len; ++k) s.push_back(alphabet[rng() % alphabet.size()]);
        string once = sanitize_for_speech(s);
        idempotent = sanitize_for_speech(once) == once;
        if (!idempotent) cout << "    counterexample: [" << s << "]\n";
    }
    check(idempotent, "sanitize is idempotent over 2000 random strings");

    string big(200000, '(');
    check(sanitize_for_speech(big).size() == big.size(), "long unbalanced input handled");
}

int main() {
    cout << "=== speech text simulation ===\n";
    sim_segmentation();
    sim_sanitize();
    return finish_sim("speech_text_sim");
}
