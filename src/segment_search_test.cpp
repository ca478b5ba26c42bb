// segment_search_test.cpp
// Paranoid search tests for iseg::immutable_segment:
// index_of / index_of_any / index_of_sequence / index_of_any_sequence,
// by-value comparers and by_ref callables.

#include <QtTest/QtTest>

#include <cctype>
#include <cstddef>
#include <cstdlib>
#include <functional>
#include <list>
#include <optional>
#include <string>
#include <vector>

#if !defined(ISEG_ASSERT) && !defined(NDEBUG)
#  define ISEG_ASSERT(expr) do { if(!(expr)) { std::abort(); } } while(0)
#endif

#include "immutable_segment.hpp"
#include "segment_search_test.h"

namespace {

using iseg::range_fault;

constexpr char32_t c0 = U'\0';

// Case-insensitive for ASCII letters; anything else compares by code point.
struct Glyph {
    char32_t value{c0};

    static char32_t fold(const char32_t c) noexcept {
        return (c >= U'A' && c <= U'Z') ? static_cast<char32_t>(c - U'A' + U'a') : c;
    }

    bool operator==(const Glyph& o) const noexcept { return fold(value) == fold(o.value); }
    bool operator!=(const Glyph& o) const noexcept { return !(*this == o); }
};

using GSeg = iseg::immutable_segment<Glyph>;
using Seg  = iseg::immutable_segment<int>;

constexpr reg npos = GSeg::npos;

// Buffer [_, _, a..h, _], window [2, 10).
static GSeg make_fixture() {
    const Glyph inner[] = {{c0}, {c0}, {U'a'}, {U'b'}, {U'c'}, {U'd'}, {U'e'}, {U'f'}, {U'g'}, {U'h'}, {c0}};
    return GSeg(inner, 11u).slice(2u, 8u);
}

// Lower-case letter a..h matches exactly one accented capital, in both directions.
static bool strange_equal(const Glyph x, const Glyph y) {
    static constexpr char32_t plain[]  = {U'a', U'b', U'c', U'd', U'e', U'f', U'g', U'h'};
    static constexpr char32_t fancy[]  = {U'Ã', U'Ɓ', U'Ç', U'Ď',
                                          U'È', U'Φ', U'Ĝ', U'Ħ'};
    for (std::size_t i = 0; i < 8u; ++i) {
        if (x.value == plain[i]) return y.value == fancy[i];
        if (x.value == fancy[i]) return y.value == plain[i];
    }
    return false;
}

static bool strange_equal_ref(const Glyph& x, const Glyph& y) {
    return strange_equal(x, y);
}

template<class F>
static std::optional<range_fault> range_fault_of(F&& f) {
    try {
        f();
    } catch (const iseg::out_of_range& e) {
        return e.fault();
    }
    return std::nullopt;
}

static void index_of_item_suite() {
    const GSeg uut = make_fixture();

    struct row { char32_t sought; reg expected; };

    for (const row& r : {row{U'A', 0u}, row{U'D', 3u}, row{U'H', 7u}, row{c0, npos}}) {
        QCOMPARE(uut.index_of(Glyph{r.sought}), r.expected);
        QCOMPARE(uut.index_of(iseg::by_ref, Glyph{r.sought}, [](const Glyph& a, const Glyph& b) { return a == b; }),
                 r.expected);
    }

    for (const row& r : {row{U'Ã', 0u}, row{U'Ď', 3u}, row{U'Ħ', 7u}, row{c0, npos}}) {
        QCOMPARE(uut.index_of(Glyph{r.sought}, 0u, npos, strange_equal), r.expected);
        QCOMPARE(uut.index_of(iseg::by_ref, Glyph{r.sought}, &strange_equal_ref), r.expected);
    }
}

static void index_of_item_start_suite() {
    const GSeg uut = make_fixture();

    struct row { char32_t sought; reg expected; };

    for (const row& r : {row{U'A', npos}, row{U'B', 1u}, row{U'D', 3u}, row{U'H', 7u}, row{c0, npos}}) {
        QCOMPARE(uut.index_of(Glyph{r.sought}, 1u), r.expected);
    }

    for (const row& r : {row{U'Ã', npos}, row{U'Ɓ', 1u}, row{U'Ď', 3u},
                         row{U'Ħ', 7u}, row{c0, npos}}) {
        QCOMPARE(uut.index_of(Glyph{r.sought}, 1u, npos, strange_equal), r.expected);
        QCOMPARE(uut.index_of(iseg::by_ref, Glyph{r.sought}, 1u, &strange_equal_ref), r.expected);
    }
}

static void index_of_item_start_count_suite() {
    const GSeg uut = make_fixture();

    struct row { char32_t sought; reg expected; };

    for (const row& r : {row{U'A', npos}, row{U'B', 1u}, row{U'D', 3u},
                         row{U'G', 6u}, row{U'H', npos}, row{c0, npos}}) {
        QCOMPARE(uut.index_of(Glyph{r.sought}, 1u, 6u), r.expected);
    }

    for (const row& r : {row{U'Ã', npos}, row{U'Ɓ', 1u}, row{U'Ď', 3u},
                         row{U'Ĝ', 6u}, row{U'Ħ', npos}, row{c0, npos}}) {
        QCOMPARE(uut.index_of(Glyph{r.sought}, 1u, 6u, strange_equal), r.expected);
        QCOMPARE(uut.index_of(iseg::by_ref, Glyph{r.sought}, 1u, 6u, &strange_equal_ref), r.expected);
    }
}

// (start, count) against the 8-element window.
static void validation_grid_suite() {
    const GSeg uut = make_fixture();
    const reg huge = static_cast<reg>(-1) - 1u;

    struct row { reg start; reg count; std::optional<range_fault> fault; };
    const row grid[] = {
        {0u, 0u, std::nullopt},
        {0u, 8u, std::nullopt},
        {0u, 9u, range_fault::extends_past_end},
        {1u, 7u, std::nullopt},
        {1u, 8u, range_fault::extends_past_end},
        {4u, 2u, std::nullopt},
        {8u, 0u, std::nullopt},
        {9u, 0u, range_fault::starts_beyond_source},
        {huge, 7u, range_fault::starts_beyond_source},
    };

    for (const row& r : grid) {
        QVERIFY(range_fault_of([&] { (void)uut.index_of(Glyph{U'c'}, r.start, r.count); }) == r.fault);
        QVERIFY(range_fault_of([&] {
                    (void)uut.index_of(iseg::by_ref, Glyph{U'c'}, r.start, r.count, &strange_equal_ref);
                }) == r.fault);
        QVERIFY(range_fault_of([&] {
                    (void)uut.index_of_any(std::vector<Glyph>{{U'c'}}, r.start, r.count);
                }) == r.fault);
        QVERIFY(range_fault_of([&] {
                    (void)uut.index_of_sequence(std::vector<Glyph>{{U'c'}}, r.start, r.count);
                }) == r.fault);
    }

    QVERIFY_THROWS_EXCEPTION(iseg::out_of_range, (void)uut.index_of(Glyph{U'c'}, npos, 0u));
}

static void null_callable_suite() {
    const GSeg uut = make_fixture();

    bool (*null_fn)(const Glyph&, const Glyph&) = nullptr;
    QVERIFY_THROWS_EXCEPTION(iseg::invalid_argument, (void)uut.index_of(iseg::by_ref, Glyph{U'a'}, null_fn));

    const std::function<bool(const Glyph&, const Glyph&)> empty_fn;
    QVERIFY_THROWS_EXCEPTION(iseg::invalid_argument, (void)uut.index_of(iseg::by_ref, Glyph{U'a'}, empty_fn));
    QVERIFY_THROWS_EXCEPTION(iseg::invalid_argument,
                             (void)uut.index_of_sequence(iseg::by_ref, std::vector<Glyph>{}, empty_fn));

    // An empty by-value comparer falls back to operator==.
    QCOMPARE(uut.index_of(Glyph{U'E'}, 0u, npos, GSeg::value_comparer()), reg{4u});
}

static void index_of_any_suite() {
    const Seg s = Seg{9, 9, 5, 3, 8, 3, 1, 9}.slice(2u, 5u); // 5 3 8 3 1

    QCOMPARE(s.index_of_any({1, 8}), reg{2u});
    QCOMPARE(s.index_of_any({1, 8}, 3u), reg{4u});
    QCOMPARE(s.index_of_any({1, 8}, 3u, 1u), npos);
    QCOMPARE(s.index_of_any({9}), npos);
    QCOMPARE(s.index_of_any(std::vector<int>{}), npos);
    QCOMPARE(s.index_of_any(std::list<int>{3}), reg{1u});
    QCOMPARE(s.index_of_any(Seg{7, 5}), reg{0u});

    const auto same_parity = [](int a, int b) { return (a % 2) == (b % 2); };
    QCOMPARE(s.index_of_any({2}, 0u, Seg::npos, same_parity), reg{2u});
    QCOMPARE(s.index_of_any(iseg::by_ref, std::vector<int>{4},
                            [](const int& a, const int& b) { return (a % 2) == (b % 2); }),
             reg{2u});
    QCOMPARE(s.index_of_any(iseg::by_ref, std::vector<int>{7}, 1u, 2u,
                            [](const int& a, const int& b) { return a % 2 == b % 2; }),
             reg{1u});

    const GSeg g = make_fixture();
    QCOMPARE(g.index_of_any(std::vector<Glyph>{{U'Ħ'}, {U'Ç'}}, 0u, npos, strange_equal), reg{2u});
}

static void index_of_sequence_suite() {
    const Seg s = Seg{0, 1, 2, 3, 1, 2, 3, 4, 0}.slice(1u, 7u); // 1 2 3 1 2 3 4

    QCOMPARE(s.index_of_sequence({2, 3}), reg{1u});
    QCOMPARE(s.index_of_sequence({2, 3}, 2u), reg{4u});
    QCOMPARE(s.index_of_sequence({3, 4}), reg{5u});
    QCOMPARE(s.index_of_sequence({3, 4}, 0u, 6u), npos);        // straddles the search end
    QCOMPARE(s.index_of_sequence({4, 0}), npos);                // straddles the window end
    QCOMPARE(s.index_of_sequence({0, 1}), npos);                // straddles the window start
    QCOMPARE(s.index_of_sequence(std::vector<int>{}), reg{0u});
    QCOMPARE(s.index_of_sequence(std::vector<int>{}, 3u), reg{3u});
    QCOMPARE(s.index_of_sequence(std::vector<int>{}, 7u), reg{7u});
    QCOMPARE(s.index_of_sequence({1, 2, 3, 1, 2, 3, 4, 5}), npos);
    QCOMPARE(s.index_of_sequence(s), reg{0u});
    QCOMPARE(s.index_of_sequence(std::list<int>{3, 1, 2}), reg{2u});

    const GSeg g = make_fixture();
    QCOMPARE(g.index_of_sequence(std::vector<Glyph>{{U'C'}, {U'D'}}), reg{2u});
    QCOMPARE(g.index_of_sequence(std::vector<Glyph>{{U'Ç'}, {U'Ď'}}, 0u, npos, strange_equal), reg{2u});
    QCOMPARE(g.index_of_sequence(iseg::by_ref, std::vector<Glyph>{{U'Ď'}, {U'È'}}, &strange_equal_ref),
             reg{3u});
    QCOMPARE(g.index_of_sequence(iseg::by_ref, std::vector<Glyph>{{U'Ď'}}, 4u, 4u, &strange_equal_ref), npos);
}

static void index_of_any_sequence_suite() {
    const Seg s{5, 1, 2, 3, 1, 2, 9};

    QCOMPARE(s.index_of_any_sequence({Seg{2, 9}, Seg{1, 2}}), reg{1u});
    QCOMPARE(s.index_of_any_sequence({Seg{7}, Seg{8}}), npos);
    QCOMPARE(s.index_of_any_sequence(std::vector<Seg>{}), npos);

    // Tie: both needles start at 1, the first one listed wins.
    const std::vector<std::vector<int>> tie{{1, 2, 3}, {1}};
    QCOMPARE(s.index_of_any_sequence(tie), reg{1u});

    // Empty needle matches at start and beats every later hit.
    QCOMPARE(s.index_of_any_sequence({Seg{3}, Seg{}}, 2u), reg{2u});

    QCOMPARE(s.index_of_any_sequence({Seg{1, 2}}, 2u), reg{4u});
    QCOMPARE(s.index_of_any_sequence({Seg{1, 2}}, 2u, 3u), npos);

    const auto mod10 = [](int a, int b) { return (a % 10) == (b % 10); };
    QCOMPARE(s.index_of_any_sequence({Seg{13, 11}}, 0u, Seg::npos, mod10), reg{3u});
    QCOMPARE(s.index_of_any_sequence(iseg::by_ref, std::vector<Seg>{Seg{19}, Seg{12}},
                                     [](const int& a, const int& b) { return a % 10 == b % 10; }),
             reg{2u});
    QCOMPARE(s.index_of_any_sequence(iseg::by_ref, std::vector<Seg>{Seg{15}}, 1u, 6u,
                                     [](const int& a, const int& b) { return a % 10 == b % 10; }),
             npos);

    QVERIFY(range_fault_of([&] { (void)s.index_of_any_sequence({Seg{1}}, 8u); })
            == range_fault::starts_beyond_source);
}

static void string_elements_suite() {
    using SSeg = iseg::immutable_segment<std::string>;
    const SSeg words{"alpha", "beta", "gamma", "beta"};

    QCOMPARE(words.index_of("beta"), reg{1u});
    QCOMPARE(words.index_of("beta", 2u), reg{3u});
    QCOMPARE(words.index_of_any({std::string("gamma"), std::string("delta")}), reg{2u});
    QCOMPARE(words.index_of_sequence({std::string("gamma"), std::string("beta")}), reg{2u});
    QCOMPARE(words.index_of(std::string("BETA"), 0u, SSeg::npos,
                            [](std::string a, std::string b) {
                                for (auto& c : a) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
                                for (auto& c : b) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
                                return a == b;
                            }),
             reg{1u});
}

// Counts its own copies; searching with contiguous candidates must not make any.
struct Tally {
    int v{0};

    static inline int copies = 0;

    Tally() = default;
    explicit Tally(int x) noexcept : v(x) {}
    Tally(const Tally& o) noexcept : v(o.v) { ++copies; }
    Tally& operator=(const Tally& o) noexcept { v = o.v; ++copies; return *this; }

    bool operator==(const Tally& o) const noexcept { return v == o.v; }
};

static void in_place_candidates_suite() {
    using TSeg = iseg::immutable_segment<Tally>;

    std::vector<Tally> items;
    for (int i = 0; i < 8; ++i) {
        items.emplace_back(i);
    }
    const TSeg s(items);
    const auto eq = [](const Tally& a, const Tally& b) { return a.v == b.v; };

    std::vector<Tally> any;
    any.emplace_back(6);
    any.emplace_back(4);
    std::vector<Tally> needle;
    needle.emplace_back(5);
    needle.emplace_back(6);
    std::vector<std::vector<Tally>> needles;
    needles.push_back(needle);
    needles.push_back(any);
    const TSeg seg_needle = s.slice(2u, 2u);

    Tally::copies = 0;
    QCOMPARE(s.index_of_any(iseg::by_ref, any, eq), reg{4u});
    QCOMPARE(s.index_of_any(iseg::by_ref, any, 5u, 3u, eq), reg{6u});
    QCOMPARE(s.index_of_any(any), reg{4u});
    QCOMPARE(s.index_of_sequence(iseg::by_ref, needle, eq), reg{5u});
    QCOMPARE(s.index_of_sequence(needle, 1u), reg{5u});
    QCOMPARE(s.index_of_sequence(iseg::by_ref, seg_needle, eq), reg{2u});
    QCOMPARE(s.index_of_any_sequence(iseg::by_ref, needles, eq), reg{5u});
    QCOMPARE(Tally::copies, 0);

    // A list has no contiguous storage and is copied once per call.
    const std::list<Tally> listed(any.begin(), any.end());
    Tally::copies = 0;
    QCOMPARE(s.index_of_any(iseg::by_ref, listed, eq), reg{4u});
    QCOMPARE(Tally::copies, 2);
}

class tst_segment_search_api_paranoid final : public QObject {
    Q_OBJECT

private slots:
    void index_of_item() {
        index_of_item_suite();
    }

    void index_of_item_start() {
        index_of_item_start_suite();
    }

    void index_of_item_start_count() {
        index_of_item_start_count_suite();
    }

    void validation_grid() {
        validation_grid_suite();
    }

    void null_callable() {
        null_callable_suite();
    }

    void index_of_any() {
        index_of_any_suite();
    }

    void index_of_sequence() {
        index_of_sequence_suite();
    }

    void index_of_any_sequence() {
        index_of_any_sequence_suite();
    }

    void in_place_candidates() {
        in_place_candidates_suite();
    }

    void string_elements() {
        string_elements_suite();
    }
};

} // namespace

int run_tst_segment_search_api_paranoid(int argc, char** argv) {
    tst_segment_search_api_paranoid tc;
    return QTest::qExec(&tc, argc, argv);
}

#include "segment_search_test.moc"
