#include "sanitizer/pattern_rule.hpp"
#include "core/types.hpp"
#include "core/utils.hpp"

#include <re2/re2.h>

#include <cctype>

namespace promptsan {

namespace {

// RE2's \s, \w and \b are ASCII-only. Rules are written against Unicode
// classes, so \s and \w are expanded before compiling and \b is checked on
// code points around each match.
constexpr std::string_view kSpaceMembers = R"(\t\n\x{0B}\f\r\x{85}\p{Z})";
constexpr std::string_view kWordMembers = R"(\p{L}\p{M}\p{Nd}\p{Pc}\p{Nl}\x{200C}\x{200D})";

struct TranslatedPattern {
    std::string body;
    bool word_start = false;
    bool word_end = false;
    std::string error;
};

// Length of a leading inline flag group such as "(?i)", or 0
size_t flag_prefix_length(std::string_view pattern) {
    if (!pattern.starts_with("(?")) return 0;
    for (size_t i = 2; i < pattern.size(); ++i) {
        const char c = pattern[i];
        if (c == ')') return i + 1;
        if (c != '-' && !std::isalpha(static_cast<unsigned char>(c))) return 0;
    }
    return 0;
}

TranslatedPattern translate(std::string_view pattern) {
    TranslatedPattern out;
    const size_t flags = flag_prefix_length(pattern);
    std::string_view body = pattern.substr(flags);

    if (body.starts_with(R"(\b)")) {
        out.word_start = true;
        body.remove_prefix(2);
    }

    out.body.reserve(pattern.size() * 2);
    out.body.append(pattern.substr(0, flags));

    bool in_class = false;
    for (size_t i = 0; i < body.size(); ++i) {
        const char c = body[i];
        if (c != '\\') {
            if (c == '[' && !in_class) {
                in_class = true;
            } else if (c == ']' && in_class) {
                in_class = false;
            }
            out.body.push_back(c);
            continue;
        }
        if (i + 1 >= body.size()) {
            out.body.push_back(c);
            continue;
        }

        const char escaped = body[++i];
        switch (escaped) {
            case 's':
                if (in_class) {
                    out.body.append(kSpaceMembers);
                } else {
                    out.body.append("[").append(kSpaceMembers).append("]");
                }
                break;
            case 'w':
                if (in_class) {
                    out.body.append(kWordMembers);
                } else {
                    out.body.append("[").append(kWordMembers).append("]");
                }
                break;
            case 'S':
                if (in_class) {
                    out.body.append(R"(\S)");
                } else {
                    out.body.append("[^").append(kSpaceMembers).append("]");
                }
                break;
            case 'W':
                if (in_class) {
                    out.body.append(R"(\W)");
                } else {
                    out.body.append("[^").append(kWordMembers).append("]");
                }
                break;
            case 'b':
                if (!in_class && i + 1 == body.size()) {
                    out.word_end = true;
                    break;
                }
                out.error = "word boundary is only supported at the start or end of a pattern";
                return out;
            case 'B':
                out.error = "\\B is not supported";
                return out;
            default:
                out.body.push_back('\\');
                out.body.push_back(escaped);
                break;
        }
    }
    return out;
}

RE2::Options rule_options() {
    RE2::Options opts;
    // Compile errors are reported through error() and logged by the owner
    opts.set_log_errors(false);
    return opts;
}

const RE2& word_char() {
    static const RE2 re(std::string("[") + std::string(kWordMembers) + "]", rule_options());
    return re;
}

bool is_word_at(std::string_view text, size_t pos) {
    if (pos >= text.size()) return false;
    size_t len = utils::detail::utf8_sequence_length(text, pos);
    if (len == 0) return false;
    return RE2::FullMatch(re2::StringPiece(text.data() + pos, len), word_char());
}

bool is_word_before(std::string_view text, size_t pos) {
    if (pos == 0) return false;
    size_t start = pos - 1;
    const auto* bytes = reinterpret_cast<const unsigned char*>(text.data());
    while (start > 0 && pos - start < 4 && utils::detail::is_continuation(bytes[start])) {
        --start;
    }
    if (utils::detail::utf8_sequence_length(text, start) != pos - start) return false;
    return is_word_at(text, start);
}

bool is_boundary(std::string_view text, size_t pos) {
    return is_word_before(text, pos) != is_word_at(text, pos);
}

// Step to the next code point, or one byte over malformed input
size_t next_position(std::string_view text, size_t pos) {
    if (pos >= text.size()) return pos + 1;
    const size_t len = utils::detail::utf8_sequence_length(text, pos);
    return pos + (len == 0 ? 1 : len);
}

} // anonymous namespace

PatternRule::PatternRule(std::string_view pattern)
    : pattern_(pattern) {
    auto translated = translate(pattern_);
    if (!translated.error.empty()) {
        error_ = std::move(translated.error);
        return;
    }
    word_start_ = translated.word_start;
    word_end_ = translated.word_end;

    auto re = std::make_unique<const RE2>(
        re2::StringPiece(translated.body.data(), translated.body.size()), rule_options());
    if (re->ok()) {
        re_ = std::move(re);
    } else {
        error_ = re->error();
    }
}

PatternRule::~PatternRule() = default;
PatternRule::PatternRule(PatternRule&&) noexcept = default;
PatternRule& PatternRule::operator=(PatternRule&&) noexcept = default;

bool PatternRule::find(std::string_view text, size_t from, size_t& begin, size_t& end) const {
    const re2::StringPiece input(text.data(), text.size());
    size_t pos = from;
    while (pos <= text.size()) {
        re2::StringPiece match;
        if (!re_->Match(input, pos, text.size(), RE2::UNANCHORED, &match, 1)) {
            return false;
        }
        const size_t b = static_cast<size_t>(match.data() - text.data());
        const size_t e = b + match.size();
        if ((!word_start_ || is_boundary(text, b)) && (!word_end_ || is_boundary(text, e))) {
            begin = b;
            end = e;
            return true;
        }
        // Retry from the next code point; a later start may still satisfy the boundaries
        pos = next_position(text, b);
    }
    return false;
}

bool PatternRule::matches(std::string_view text) const {
    if (!re_) return false;
    size_t begin = 0;
    size_t end = 0;
    return find(text, 0, begin, end);
}

size_t PatternRule::replace_all(std::string& text) const {
    if (!re_) return 0;

    std::string out;
    size_t count = 0;
    size_t copied = 0;
    size_t pos = 0;
    size_t begin = 0;
    size_t end = 0;
    while (pos <= text.size() && find(text, pos, begin, end)) {
        out.append(text, copied, begin - copied);
        out.append(kFilteredMarker);
        copied = end;
        ++count;
        pos = (end == begin) ? next_position(text, end) : end;
    }
    if (count == 0) return 0;

    // Empty matches may have stepped past the end
    if (copied < text.size()) {
        out.append(text, copied, std::string::npos);
    }
    text = std::move(out);
    return count;
}

} // namespace promptsan
