#include "structural_parser.hpp"
#include <algorithm>
#include <cctype>
#include <limits>
#include <optional>
#include <unordered_set>

namespace sharpmap {

namespace {

constexpr size_t npos = std::numeric_limits<size_t>::max();

int count_lines(const std::string& content) {
    if (content.empty()) return 0;
    int lines = static_cast<int>(std::count(content.begin(), content.end(), '\n'));
    if (content.back() != '\n') ++lines;
    return lines;
}

std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

bool is_blank_char(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\f' || c == '\v';
}

bool is_ident_start(char c) {
    unsigned char u = static_cast<unsigned char>(c);
    return std::isalpha(u) || c == '_' || u >= 0x80;
}

bool is_ident_char(char c) {
    unsigned char u = static_cast<unsigned char>(c);
    return std::isalnum(u) || c == '_' || u >= 0x80;
}

// --- LITERAL SKIPPING ---

bool starts_string(const std::string& s, size_t i) {
    const size_t n = s.size();
    if (s[i] == '"') return true;
    if (s[i] == '@') {
        if (i + 1 < n && s[i + 1] == '"') return true;
        return i + 2 < n && s[i + 1] == '$' && s[i + 2] == '"';
    }
    if (s[i] == '$') {
        size_t p = i;
        while (p < n && s[p] == '$') ++p;
        if (p < n && s[p] == '@') ++p;
        return p < n && s[p] == '"';
    }
    return false;
}

size_t skip_char_literal(const std::string& s, size_t i) {
    const size_t n = s.size();
    if (i + 1 >= n || s[i + 1] == '\n') return i;
    if (s[i + 1] == '\\') {
        for (size_t k = i + 3; k < n && k < i + 12; ++k) {
            if (s[k] == '\n') break;
            if (s[k] == '\'') return k + 1;
        }
        return i;
    }
    if (i + 2 < n && s[i + 2] == '\'') return i + 3;
    if (static_cast<unsigned char>(s[i + 1]) >= 0x80) {
        for (size_t k = i + 2; k < n && k < i + 6; ++k) {
            if (s[k] == '\'') return k + 1;
        }
    }
    return i;
}

size_t skip_string(const std::string& s, size_t i, bool& terminated);

// Interpolation hole starting at '{'. Returns the index after its '}'.
size_t skip_hole(const std::string& s, size_t i) {
    const size_t n = s.size();
    int depth = 0;
    size_t k = i;
    while (k < n) {
        char c = s[k];
        if (starts_string(s, k)) {
            bool ignored = false;
            k = skip_string(s, k, ignored);
            continue;
        }
        if (c == '\'') {
            size_t e = skip_char_literal(s, k);
            if (e > k) { k = e; continue; }
        }
        if (c == '{') ++depth;
        if (c == '}' && --depth == 0) return k + 1;
        ++k;
    }
    return n;
}

size_t skip_string(const std::string& s, size_t i, bool& terminated) {
    const size_t n = s.size();
    size_t p = i;
    int dollars = 0;
    bool verbatim = false;
    while (p < n && (s[p] == '$' || s[p] == '@')) {
        if (s[p] == '$') ++dollars; else verbatim = true;
        ++p;
    }
    size_t q = p;
    while (q < n && s[q] == '"') ++q;
    const size_t quotes = q - p;

    if (!verbatim && quotes >= 3) {
        // Raw literal: closed by a run of at least as many quotes.
        size_t k = q;
        while (k < n) {
            if (s[k] == '"') {
                size_t r = k;
                while (r < n && s[r] == '"') ++r;
                if (r - k >= quotes) { terminated = true; return r; }
                k = r;
                continue;
            }
            ++k;
        }
        terminated = false;
        return n;
    }
    if (!verbatim && quotes == 2) {
        terminated = true;
        return p + 2;
    }

    size_t k = p + 1;
    while (k < n) {
        char c = s[k];
        if (verbatim) {
            if (c == '"') {
                if (k + 1 < n && s[k + 1] == '"') { k += 2; continue; }
                terminated = true;
                return k + 1;
            }
        } else {
            if (c == '\\') { k += 2; continue; }
            if (c == '"') { terminated = true; return k + 1; }
            if (c == '\n') { terminated = false; return k; }
        }
        if (dollars > 0 && c == '{') {
            if (k + 1 < n && s[k + 1] == '{') { k += 2; continue; }
            k = skip_hole(s, k);
            continue;
        }
        ++k;
    }
    terminated = false;
    return n;
}

// --- TOKENS ---

struct Token {
    enum class Type { Identifier, Number, Literal, Punct };
    Type type;
    std::string text;
    int line;
};

const std::unordered_set<std::string>& two_char_operators() {
    static const std::unordered_set<std::string> ops = {
        "=>", "==", "!=", "<=", ">=", "::", "&&", "||", "??", "++", "--", "->",
        "+=", "-=", "*=", "/=", "%=", "&=", "|=", "^="};
    return ops;
}

std::vector<Token> tokenize(const std::string& masked) {
    std::vector<Token> tokens;
    const size_t n = masked.size();
    int line = 1;
    size_t i = 0;
    while (i < n) {
        char c = masked[i];
        if (c == '\n') { ++line; ++i; continue; }
        if (is_blank_char(c)) { ++i; continue; }

        if (c == kStringMark || c == kCharMark) {
            size_t e = i;
            while (e < n && masked[e] == c) ++e;
            tokens.push_back({Token::Type::Literal, c == kStringMark ? "\"...\"" : "'.'", line});
            i = e;
            continue;
        }
        if (is_ident_start(c) || (c == '@' && i + 1 < n && is_ident_start(masked[i + 1]))) {
            size_t e = i + 1;
            while (e < n && is_ident_char(masked[e])) ++e;
            tokens.push_back({Token::Type::Identifier, masked.substr(i, e - i), line});
            i = e;
            continue;
        }
        if (std::isdigit(static_cast<unsigned char>(c))) {
            size_t e = i + 1;
            while (e < n && (is_ident_char(masked[e]) || masked[e] == '.')) ++e;
            tokens.push_back({Token::Type::Number, masked.substr(i, e - i), line});
            i = e;
            continue;
        }
        if (i + 1 < n && two_char_operators().count(masked.substr(i, 2))) {
            tokens.push_back({Token::Type::Punct, masked.substr(i, 2), line});
            i += 2;
            continue;
        }
        tokens.push_back({Token::Type::Punct, std::string(1, c), line});
        ++i;
    }
    return tokens;
}

std::string strip_doc_markup(const std::string& raw) {
    std::string text = raw;
    std::string lower = to_lower(text);
    size_t open = lower.find("<summary>");
    if (open != std::string::npos) {
        size_t close = lower.find("</summary>", open);
        size_t from = open + 9;
        text = text.substr(from, close == std::string::npos ? std::string::npos : close - from);
    }

    std::string plain;
    bool in_tag = false;
    for (char c : text) {
        if (c == '<') { in_tag = true; plain += ' '; continue; }
        if (c == '>' && in_tag) { in_tag = false; continue; }
        if (!in_tag) plain += c;
    }

    const std::pair<const char*, const char*> entities[] = {
        {"&lt;", "<"}, {"&gt;", ">"}, {"&quot;", "\""}, {"&amp;", "&"}};
    for (const auto& [from, to] : entities) {
        size_t pos = 0;
        std::string key(from);
        while ((pos = plain.find(key, pos)) != std::string::npos) {
            plain.replace(pos, key.size(), to);
            pos += 1;
        }
    }

    std::string collapsed;
    bool pending_space = false;
    for (char c : plain) {
        if (std::isspace(static_cast<unsigned char>(c))) { pending_space = !collapsed.empty(); continue; }
        if (pending_space) collapsed += ' ';
        pending_space = false;
        collapsed += c;
    }
    return collapsed;
}

// --- DECLARATION SCANNER ---

class DeclarationScanner {
public:
    DeclarationScanner(const MaskedSource& src, const std::vector<Token>& tokens, StructuralDocument& doc)
        : src_(src), toks_(tokens), doc_(doc) {}

    void run() {
        match_braces();
        scan_block(0, toks_.size(), Scope::Namespace, "", -1);
    }

private:
    enum class Scope { Namespace, TypeBody };

    struct Header {
        size_t attr_begin = 0;
        size_t begin = 0;
        size_t term = 0;
    };

    const MaskedSource& src_;
    const std::vector<Token>& toks_;
    StructuralDocument& doc_;
    std::vector<size_t> match_;

    bool is(size_t i, const char* text) const { return i < toks_.size() && toks_[i].text == text; }
    bool is_ident(size_t i) const { return i < toks_.size() && toks_[i].type == Token::Type::Identifier; }
    bool is_modifier(size_t i) const { return is_ident(i) && modifier_from_keyword(toks_[i].text) != MOD_NONE; }
    int last_line() const { return std::max(src_.line_count, 1); }
    int line_at(size_t i) const { return i < toks_.size() ? toks_[i].line : last_line(); }

    void warn(int start, int end, std::string message) {
        doc_.warnings.push_back({start, std::max(start, end), std::move(message)});
    }

    void match_braces() {
        match_.assign(toks_.size(), toks_.size());
        std::vector<size_t> open;
        for (size_t i = 0; i < toks_.size(); ++i) {
            if (toks_[i].text == "{") {
                open.push_back(i);
            } else if (toks_[i].text == "}") {
                if (open.empty()) {
                    warn(toks_[i].line, toks_[i].line, "unmatched '}' ignored");
                    continue;
                }
                match_[open.back()] = i;
                match_[i] = open.back();
                open.pop_back();
            }
        }
        for (size_t idx : open) {
            warn(toks_[idx].line, last_line(), "'{' is never closed; scope closed at end of file");
        }
    }

    // Index of the close token matching the open token at `open`, or `end`.
    size_t close_of(size_t open, size_t end, const char* open_text, const char* close_text) const {
        int depth = 0;
        for (size_t k = open; k < end; ++k) {
            if (toks_[k].text == open_text) ++depth;
            else if (toks_[k].text == close_text && --depth == 0) return k;
            else if (toks_[k].text == "{" && std::string(open_text) != "{") {
                if (match_[k] >= end) return end;
                k = match_[k];
            }
        }
        return end;
    }

    Header read_header(size_t from, size_t end) const {
        Header h;
        h.attr_begin = from;
        size_t i = from;
        while (i < end && is(i, "[")) {
            i = close_of(i, end, "[", "]");
            if (i < end) ++i;
        }
        h.begin = std::min(i, end);
        int paren = 0;
        int bracket = 0;
        for (; i < end; ++i) {
            const std::string& x = toks_[i].text;
            if (x == "{") {
                if (paren == 0 && bracket == 0) { h.term = i; return h; }
                if (match_[i] >= end) break;
                i = match_[i];
            } else if (x == "}") {
                h.term = i;
                return h;
            } else if (x == "(") {
                ++paren;
            } else if (x == ")") {
                paren = std::max(0, paren - 1);
            } else if (x == "[") {
                ++bracket;
            } else if (x == "]") {
                bracket = std::max(0, bracket - 1);
            } else if (paren == 0 && bracket == 0 && (x == ";" || x == "=>")) {
                h.term = i;
                return h;
            }
        }
        h.term = end;
        return h;
    }

    // Returns the index after the ';' that ends the statement at `from`.
    size_t skip_statement(size_t from, size_t end) const {
        int depth = 0;
        for (size_t k = from; k < end; ++k) {
            const std::string& x = toks_[k].text;
            if (x == "{") {
                if (match_[k] >= end) return end;
                k = match_[k];
            } else if (x == "}") {
                return k;
            } else if (x == "(" || x == "[") {
                ++depth;
            } else if (x == ")" || x == "]") {
                depth = std::max(0, depth - 1);
            } else if (x == ";" && depth == 0) {
                return k + 1;
            }
        }
        return end;
    }

    std::string render(size_t from, size_t to) const {
        std::string out;
        std::string prev;
        bool prev_ident = false;
        for (size_t k = from; k < to && k < toks_.size(); ++k) {
            const std::string& x = toks_[k].text;
            bool glue = out.empty();
            if (x == "," || x == ")" || x == "]" || x == "." || x == ">" || x == ";" || x == "?" || x == "::") glue = true;
            if ((x == "(" || x == "<" || x == "[") &&
                ((prev_ident && modifier_from_keyword(prev) == MOD_NONE) || prev == ">" || prev == "]")) glue = true;
            if (x == "[" && prev == "?") glue = true;
            if (prev == "(" || prev == "[" || prev == "<" || prev == "." || prev == "~" || prev == "::") glue = true;
            if (!glue) out += ' ';
            out += x;
            prev = x;
            prev_ident = toks_[k].type == Token::Type::Identifier;
        }
        return out;
    }

    std::optional<std::string> summary_above(int line) const {
        std::vector<std::string> parts;
        for (int l = line - 1; l >= 1 && src_.doc_only[l - 1]; --l) {
            parts.push_back(src_.doc_comments[l - 1]);
        }
        if (parts.empty()) return std::nullopt;
        std::reverse(parts.begin(), parts.end());
        std::string joined;
        for (const auto& p : parts) joined += p + "\n";
        std::string text = strip_doc_markup(joined);
        if (text.empty()) return std::nullopt;
        return text;
    }

    size_t find_type_keyword(const Header& h) const {
        for (size_t j = h.begin; j < h.term && j < toks_.size(); ++j) {
            if (!is_ident(j)) return npos;
            const std::string& x = toks_[j].text;
            if (x == "class" || x == "interface" || x == "enum" || x == "struct") return j;
            if (x == "record" && (is_ident(j + 1) && j + 1 < h.term)) return j;
            if (modifier_from_keyword(x) == MOD_NONE) return npos;
        }
        return npos;
    }

    size_t skip_past(const Header& h, size_t end) const {
        if (h.term >= end) return end;
        const std::string& x = toks_[h.term].text;
        if (x == "{") return match_[h.term] >= end ? end : match_[h.term] + 1;
        if (x == "=>") return skip_statement(h.term, end);
        return h.term + 1;
    }

    void scan_block(size_t begin, size_t end, Scope scope, std::string ns, int owner) {
        size_t i = begin;
        while (i < end) {
            const std::string& t = toks_[i].text;
            if (t == ";" || t == "}") { ++i; continue; }

            Header h = read_header(i, end);
            if (h.begin >= end) break;
            if (h.term < end && toks_[h.term].text == "}") {
                // A stray brace cut the header short.
                i = h.term + 1;
                continue;
            }

            size_t kw = find_type_keyword(h);
            if (kw != npos) {
                i = scan_type(h, kw, end, ns, owner);
            } else if (h.term >= end) {
                warn(line_at(h.begin), line_at(end - 1), "incomplete declaration skipped");
                break;
            } else if (is(h.begin, "namespace")) {
                i = scan_namespace(h, end, ns);
            } else if (scope == Scope::Namespace && (is(h.begin, "using") || (is(h.begin, "global") && is(h.begin + 1, "using")))) {
                record_using(h);
                i = skip_past(h, end);
            } else if (scope == Scope::TypeBody && owner >= 0) {
                i = scan_member(h, end, owner);
            } else {
                i = skip_past(h, end);
            }
            if (i <= h.begin) i = h.begin + 1;
        }
    }

    size_t scan_namespace(const Header& h, size_t end, std::string& current_ns) {
        std::string name;
        for (size_t j = h.begin + 1; j < h.term && (is_ident(j) || is(j, ".")); ++j) name += toks_[j].text;
        if (name.empty()) {
            warn(line_at(h.begin), line_at(h.begin), "namespace declaration without a name");
            return skip_past(h, end);
        }
        if (!doc_.namespace_name) doc_.namespace_name = name;
        std::string qualified = current_ns.empty() ? name : current_ns + "." + name;

        if (toks_[h.term].text == ";") {
            current_ns = qualified;
            return h.term + 1;
        }
        if (toks_[h.term].text == "{") {
            size_t close = match_[h.term];
            scan_block(h.term + 1, std::min(close, end), Scope::Namespace, qualified, -1);
            return close >= end ? end : close + 1;
        }
        return skip_past(h, end);
    }

    void record_using(const Header& h) {
        if (h.term >= toks_.size() || toks_[h.term].text != ";") return;
        size_t j = h.begin;
        if (is(j, "global")) ++j;
        ++j;
        if (is(j, "static")) ++j;
        if (is_ident(j) && is(j + 1, "=")) j += 2;
        std::string name;
        for (; j < h.term; ++j) {
            const std::string& x = toks_[j].text;
            if (is_ident(j) || x == "." || x == "::" || x == "<" || x == ">") name += x;
            else if (x == ",") name += ", ";
            else return;
        }
        if (!name.empty()) doc_.imports.insert(name);
    }

    std::vector<Parameter> parse_parameters(size_t open, size_t close) const {
        std::vector<Parameter> params;
        size_t seg = open + 1;
        int depth = 0;
        auto flush = [&](size_t from, size_t to) {
            while (from < to && is(from, "[")) {
                size_t c = close_of(from, to, "[", "]");
                from = c < to ? c + 1 : to;
            }
            size_t stop = from;
            int d = 0;
            for (; stop < to; ++stop) {
                const std::string& x = toks_[stop].text;
                if (x == "(" || x == "[" || x == "<") ++d;
                else if (x == ")" || x == "]" || x == ">") --d;
                else if (x == "=" && d == 0) break;
            }
            if (stop <= from) return;
            size_t name_idx = stop - 1;
            if (!is_ident(name_idx)) return;
            params.push_back({render(from, name_idx), toks_[name_idx].text});
        };
        for (size_t k = open + 1; k < close; ++k) {
            const std::string& x = toks_[k].text;
            if (x == "(" || x == "[" || x == "<") ++depth;
            else if (x == ")" || x == "]" || x == ">") --depth;
            else if (x == "{" && match_[k] < close) k = match_[k];
            else if (x == "," && depth == 0) { flush(seg, k); seg = k + 1; }
        }
        flush(seg, close);
        return params;
    }

    std::string qualified_owner(int owner) const {
        const auto& o = doc_.declarations[owner];
        return o.containing_type.empty() ? o.name : o.containing_type + "." + o.name;
    }

    size_t scan_type(const Header& h, size_t kw, size_t end, const std::string& ns, int owner) {
        TypeDeclaration decl;
        for (size_t j = h.begin; j < kw; ++j) decl.modifiers |= modifier_from_keyword(toks_[j].text);

        const std::string& keyword = toks_[kw].text;
        size_t j = kw + 1;
        if (keyword == "class") decl.kind = TypeKind::Class;
        else if (keyword == "interface") decl.kind = TypeKind::Interface;
        else if (keyword == "enum") decl.kind = TypeKind::Enum;
        else if (keyword == "struct") decl.kind = TypeKind::Struct;
        else {
            decl.kind = TypeKind::Record;
            if (is(j, "class") || is(j, "struct")) ++j;
        }

        if (j >= h.term || !is_ident(j)) {
            warn(line_at(kw), line_at(kw), "'" + keyword + "' without a type name");
            return skip_past(h, end);
        }
        decl.name = toks_[j].text;
        ++j;

        if (is(j, "<")) {
            size_t close = close_of(j, h.term, "<", ">");
            for (size_t k = j + 1; k < close; ++k) {
                if (is_ident(k) && (is(k + 1, ",") || k + 1 == close) && toks_[k].text != "in" && toks_[k].text != "out") {
                    decl.generic_parameters.push_back(toks_[k].text);
                }
            }
            j = close < h.term ? close + 1 : h.term;
        }

        std::vector<Parameter> positional;
        if (is(j, "(") && j < h.term) {
            size_t close = close_of(j, h.term, "(", ")");
            positional = parse_parameters(j, close);
            j = close < h.term ? close + 1 : h.term;
        }

        if (is(j, ":") && j < h.term) {
            size_t seg = j + 1;
            int depth = 0;
            size_t k = j + 1;
            auto flush = [&](size_t from, size_t to) {
                size_t stop = from;
                while (stop < to && !is(stop, "(")) ++stop;
                std::string base = render(from, stop);
                if (!base.empty()) decl.base_types.push_back(base);
            };
            for (; k < h.term; ++k) {
                const std::string& x = toks_[k].text;
                if (depth == 0 && x == "where") break;
                if (x == "<" || x == "(") ++depth;
                else if (x == ">" || x == ")") --depth;
                else if (x == "," && depth == 0) { flush(seg, k); seg = k + 1; }
            }
            flush(seg, k);
        }

        decl.span.start_line = toks_[h.begin].line;
        decl.summary = summary_above(toks_[h.attr_begin].line);
        decl.namespace_name = ns;
        if (owner >= 0) decl.containing_type = qualified_owner(owner);

        if (decl.kind == TypeKind::Record) {
            for (const auto& p : positional) {
                Member m;
                m.name = p.name;
                m.kind = MemberKind::Property;
                m.modifiers = MOD_PUBLIC;
                m.return_type = p.type;
                m.has_getter = true;
                m.has_setter = true;
                m.line = decl.span.start_line;
                m.signature = "public " + p.type + " " + p.name + " { get; init; }";
                decl.members.push_back(std::move(m));
            }
        }

        const int idx = static_cast<int>(doc_.declarations.size());
        const TypeKind kind = decl.kind;
        const std::string name = decl.name;
        doc_.declarations.push_back(std::move(decl));

        if (h.term >= end) {
            warn(line_at(h.begin), last_line(), "declaration of '" + name + "' is not terminated; closed at end of file");
            doc_.declarations[idx].span.end_line = last_line();
            return end;
        }

        const std::string& term = toks_[h.term].text;
        size_t next;
        int end_line;
        if (term == "{") {
            size_t close = match_[h.term];
            size_t body_end = std::min(close, end);
            if (kind == TypeKind::Enum) scan_enum_values(h.term + 1, body_end, idx);
            else scan_block(h.term + 1, body_end, Scope::TypeBody, ns, idx);
            if (close >= toks_.size()) {
                end_line = last_line();
                next = end;
            } else {
                end_line = toks_[close].line;
                next = close + 1;
            }
        } else if (term == "=>") {
            next = skip_statement(h.term, end);
            end_line = line_at(next > 0 ? next - 1 : 0);
        } else {
            end_line = toks_[h.term].line;
            next = h.term + 1;
        }
        doc_.declarations[idx].span.end_line = std::max(end_line, doc_.declarations[idx].span.start_line);
        return next;
    }

    void scan_enum_values(size_t begin, size_t end, int owner) {
        size_t seg = begin;
        int depth = 0;
        auto flush = [&](size_t from, size_t to) {
            while (from < to && is(from, "[")) {
                size_t c = close_of(from, to, "[", "]");
                from = c < to ? c + 1 : to;
            }
            if (from >= to || !is_ident(from)) return;
            Member m;
            m.name = toks_[from].text;
            m.kind = MemberKind::EnumValue;
            m.line = toks_[from].line;
            m.signature = render(from, to);
            m.summary = summary_above(m.line);
            doc_.declarations[owner].members.push_back(std::move(m));
        };
        for (size_t k = begin; k < end; ++k) {
            const std::string& x = toks_[k].text;
            if (x == "(" || x == "[") ++depth;
            else if (x == ")" || x == "]") --depth;
            else if (x == "," && depth == 0) { flush(seg, k); seg = k + 1; }
        }
        flush(seg, end);
    }

    // Field declarators: "int a, b = 2;" yields a and b.
    void add_fields(const Header& h, size_t first, size_t stop, uint32_t modifiers, bool is_event, int owner) {
        std::vector<std::pair<size_t, size_t>> segments;
        size_t seg = first;
        int depth = 0;
        bool in_init = false;
        for (size_t k = first; k < stop; ++k) {
            const std::string& x = toks_[k].text;
            if (x == "{") {
                if (match_[k] >= stop) break;
                k = match_[k];
                continue;
            }
            if (x == "(" || x == "[" || (!in_init && x == "<")) ++depth;
            else if (x == ")" || x == "]" || (!in_init && x == ">")) depth = std::max(0, depth - 1);
            else if (x == "=" && depth == 0) in_init = true;
            else if (x == "," && depth == 0) {
                segments.emplace_back(seg, k);
                seg = k + 1;
                in_init = false;
            }
        }
        segments.emplace_back(seg, stop);

        auto name_before_init = [&](size_t from, size_t to) -> size_t {
            size_t k = from;
            while (k < to && !is(k, "=")) ++k;
            return (k > from && is_ident(k - 1)) ? k - 1 : npos;
        };

        size_t first_name = name_before_init(segments[0].first, segments[0].second);
        if (first_name == npos) return;
        const std::string type = render(first, first_name);
        const std::string prefix = render(h.begin, first_name);
        const std::optional<std::string> summary = summary_above(toks_[h.attr_begin].line);

        for (size_t s = 0; s < segments.size(); ++s) {
            size_t name_idx;
            if (s == 0) {
                name_idx = first_name;
            } else {
                name_idx = segments[s].first;
                bool declarator = is_ident(name_idx) &&
                    (name_idx + 1 == segments[s].second || is(name_idx + 1, "="));
                if (!declarator) continue;
            }
            Member m;
            m.name = toks_[name_idx].text;
            m.kind = is_event ? MemberKind::Event : MemberKind::Field;
            m.modifiers = modifiers;
            m.return_type = type;
            m.line = toks_[name_idx].line;
            m.signature = prefix + " " + m.name;
            m.summary = summary;
            doc_.declarations[owner].members.push_back(std::move(m));
        }
    }

    size_t scan_member(const Header& h, size_t end, int owner) {
        if (doc_.declarations[owner].kind == TypeKind::Enum) return skip_past(h, end);

        Member m;
        size_t j = h.begin;
        while (j < h.term && is_modifier(j)) {
            m.modifiers |= modifier_from_keyword(toks_[j].text);
            ++j;
        }
        bool is_event = false;
        bool is_delegate = false;
        if (is(j, "event")) { is_event = true; ++j; }
        else if (is(j, "delegate")) { is_delegate = true; ++j; }
        const size_t decl_begin = j;
        m.line = line_at(h.begin);
        m.summary = summary_above(toks_[h.attr_begin].line);

        size_t op = npos;
        for (size_t k = decl_begin; k < h.term; ++k) {
            if (is(k, "operator")) { op = k; break; }
        }

        size_t eq = npos;
        size_t lp = npos;
        int paren = 0;
        int bracket = 0;
        for (size_t k = decl_begin; k < h.term; ++k) {
            const std::string& x = toks_[k].text;
            if (x == "(") {
                if (paren == 0 && bracket == 0 && lp == npos && eq == npos) {
                    bool candidate;
                    if (op != npos) {
                        candidate = k >= op + 2;
                    } else {
                        candidate = k > decl_begin &&
                            ((is_ident(k - 1) && modifier_from_keyword(toks_[k - 1].text) == MOD_NONE) || is(k - 1, ">"));
                    }
                    if (candidate) lp = k;
                }
                ++paren;
            } else if (x == ")") {
                paren = std::max(0, paren - 1);
            } else if (x == "[") {
                ++bracket;
            } else if (x == "]") {
                bracket = std::max(0, bracket - 1);
            } else if (x == "=" && paren == 0 && bracket == 0 && eq == npos) {
                eq = k;
            }
        }

        const std::string& term = toks_[h.term].text;

        if (eq != npos && (lp == npos || eq < lp)) {
            size_t stmt_end = term == ";" ? h.term + 1 : skip_statement(h.term, end);
            size_t stop = (stmt_end > 0 && is(stmt_end - 1, ";")) ? stmt_end - 1 : stmt_end;
            add_fields(h, decl_begin, stop, m.modifiers, is_event, owner);
            return stmt_end;
        }

        if (lp != npos) {
            size_t rp = close_of(lp, h.term, "(", ")");
            size_t name_end = lp;
            size_t name_idx = lp - 1;
            if (op != npos) {
                m.name = "operator " + render(op + 1, lp);
                name_idx = op;
                while (name_idx > decl_begin && (is(name_idx - 1, "implicit") || is(name_idx - 1, "explicit"))) --name_idx;
            } else {
                if (is(name_idx, ">")) {
                    int depth = 0;
                    for (size_t k = name_idx + 1; k-- > decl_begin;) {
                        if (is(k, ">")) ++depth;
                        else if (is(k, "<") && --depth == 0) {
                            if (k > decl_begin) name_idx = k - 1;
                            break;
                        }
                    }
                    if (!is_ident(name_idx)) return skip_past(h, end);
                    name_end = name_idx + 1;
                }
                size_t qual = name_idx;
                while (qual >= decl_begin + 2 && is(qual - 1, ".") && is_ident(qual - 2)) qual -= 2;
                m.name = render(qual, name_end);
                if (qual > decl_begin && is(qual - 1, "~")) {
                    --qual;
                    m.name = "~" + m.name;
                }
                name_idx = qual;
            }

            const std::string& owner_name = doc_.declarations[owner].name;
            if (is_delegate) m.kind = MemberKind::Delegate;
            else if (name_idx == decl_begin && m.name == owner_name) m.kind = MemberKind::Constructor;
            else if (m.name == "~" + owner_name) m.kind = MemberKind::Constructor;
            else m.kind = MemberKind::Method;

            m.return_type = m.kind == MemberKind::Constructor ? "" : render(decl_begin, name_idx);
            m.parameters = parse_parameters(lp, rp);
            m.signature = render(h.begin, h.term);

            size_t next;
            if (term == "{") {
                size_t close = match_[h.term];
                m.has_body = true;
                m.has_nontrivial_body = close >= toks_.size() ? h.term + 1 < toks_.size() : close > h.term + 1;
                next = close >= end ? end : close + 1;
            } else if (term == "=>") {
                m.has_body = true;
                m.has_nontrivial_body = true;
                next = skip_statement(h.term, end);
            } else {
                next = h.term + 1;
            }
            doc_.declarations[owner].members.push_back(std::move(m));
            return next;
        }

        if (term == ";") {
            add_fields(h, decl_begin, h.term, m.modifiers, is_event, owner);
            return h.term + 1;
        }

        // Property, indexer or event with accessors.
        size_t name_idx = h.term - 1;
        if (h.term == 0 || name_idx < decl_begin) return skip_past(h, end);
        if (is(name_idx, "]")) {
            size_t open = npos;
            int depth = 0;
            for (size_t k = name_idx + 1; k-- > decl_begin;) {
                if (is(k, "]")) ++depth;
                else if (is(k, "[") && --depth == 0) { open = k; break; }
            }
            if (open != npos && open > decl_begin && is(open - 1, "this")) {
                m.parameters = parse_parameters(open, name_idx);
                name_idx = open - 1;
            }
        }
        if (!is_ident(name_idx)) return skip_past(h, end);
        size_t qual = name_idx;
        while (qual >= decl_begin + 2 && is(qual - 1, ".") && is_ident(qual - 2)) qual -= 2;

        m.name = toks_[name_idx].text;
        m.kind = is_event ? MemberKind::Event : MemberKind::Property;
        m.return_type = render(decl_begin, qual);
        m.signature = render(h.begin, h.term);

        size_t next;
        if (term == "{") {
            size_t close = match_[h.term];
            size_t stop = std::min(close, end);
            for (size_t k = h.term + 1; k < stop; ++k) {
                const std::string& x = toks_[k].text;
                if (x == "{") {
                    if (match_[k] >= stop) break;
                    k = match_[k];
                } else if (x == "get" || x == "add") {
                    m.has_getter = true;
                } else if (x == "set" || x == "init" || x == "remove") {
                    m.has_setter = true;
                }
            }
            m.has_body = true;
            next = close >= end ? end : close + 1;
            if (is(next, "=") && next < end) next = skip_statement(next, end);
        } else {
            m.has_getter = true;
            m.has_body = true;
            next = skip_statement(h.term, end);
        }
        doc_.declarations[owner].members.push_back(std::move(m));
        return next;
    }
};

} // namespace

MaskedSource mask_source(const std::string& content) {
    MaskedSource out;
    out.text = content;
    out.line_count = count_lines(content);
    const size_t slots = static_cast<size_t>(std::max(out.line_count, 1));
    out.doc_comments.assign(slots, "");
    out.doc_only.assign(slots, false);
    out.has_code.assign(slots, false);
    out.has_comment.assign(slots, false);

    const size_t n = content.size();
    int line = 1;
    bool line_has_token = false;

    auto slot = [&]() { return static_cast<size_t>(std::min(line, static_cast<int>(slots)) - 1); };

    // Blank [from, to) with `fill`, keeping newlines, and tag each touched
    // line as code or comment.
    auto mask_range = [&](size_t from, size_t to, char fill, bool code) {
        for (size_t k = from; k < to; ++k) {
            char c = content[k];
            if (c == '\n') {
                ++line;
                line_has_token = false;
                continue;
            }
            out.text[k] = fill;
            if (is_blank_char(c)) continue;
            if (code) {
                out.has_code[slot()] = true;
                line_has_token = true;
            } else {
                out.has_comment[slot()] = true;
            }
        }
    };

    auto end_of_line = [&](size_t from) {
        size_t e = content.find('\n', from);
        return e == std::string::npos ? n : e;
    };

    size_t i = 0;
    while (i < n) {
        const char c = content[i];
        if (c == '\n') {
            ++line;
            line_has_token = false;
            ++i;
            continue;
        }
        if (is_blank_char(c)) { ++i; continue; }

        if (c == '#' && !line_has_token) {
            size_t e = end_of_line(i);
            mask_range(i, e, ' ', true);
            i = e;
            continue;
        }
        if (c == '/' && i + 1 < n && content[i + 1] == '/') {
            size_t e = end_of_line(i);
            bool doc = i + 2 < n && content[i + 2] == '/' && !(i + 3 < n && content[i + 3] == '/');
            if (doc && !line_has_token) {
                std::string text = content.substr(i + 3, e - (i + 3));
                if (!text.empty() && text.back() == '\r') text.pop_back();
                out.doc_comments[slot()] = text;
                out.doc_only[slot()] = true;
            }
            mask_range(i, e, ' ', false);
            i = e;
            continue;
        }
        if (c == '/' && i + 1 < n && content[i + 1] == '*') {
            const int start_line = line;
            size_t close = content.find("*/", i + 2);
            size_t e = close == std::string::npos ? n : close + 2;
            mask_range(i, e, ' ', false);
            if (close == std::string::npos) {
                out.warnings.push_back({start_line, std::max(start_line, out.line_count), "unterminated block comment"});
            }
            i = e;
            continue;
        }
        if (starts_string(content, i)) {
            const int start_line = line;
            bool terminated = false;
            size_t e = skip_string(content, i, terminated);
            mask_range(i, e, kStringMark, true);
            if (!terminated) {
                out.warnings.push_back({start_line, std::max(start_line, line), "unterminated string literal"});
            }
            i = e;
            continue;
        }
        if (c == '\'') {
            size_t e = skip_char_literal(content, i);
            if (e > i) {
                mask_range(i, e, kCharMark, true);
                i = e;
                continue;
            }
        }
        if (is_ident_start(c) || c == '@') {
            // Whole identifiers, so "@" and "$" inside names never open a literal.
            size_t e = i + 1;
            while (e < n && is_ident_char(content[e])) ++e;
            if (c != '@' || e > i + 1) {
                out.has_code[slot()] = true;
                line_has_token = true;
                i = e;
                continue;
            }
        }
        out.has_code[slot()] = true;
        line_has_token = true;
        ++i;
    }

    // A "///" line that turned out to carry code is not a documentation line.
    for (size_t l = 0; l < slots; ++l) {
        if (out.has_code[l]) out.doc_only[l] = false;
    }
    return out;
}

StructuralDocument StructuralParser::parse(const std::string& content) {
    StructuralDocument doc;
    if (content.empty()) return doc;

    MaskedSource masked = mask_source(content);
    doc.warnings = masked.warnings;
    std::vector<Token> tokens = tokenize(masked.text);

    FileMetrics& metrics = doc.metrics;
    metrics.total_lines = masked.line_count;
    for (int l = 0; l < masked.line_count; ++l) {
        if (masked.has_code[l]) ++metrics.code_lines;
        else if (masked.has_comment[l]) ++metrics.comment_lines;
        else ++metrics.blank_lines;
        if (!metrics.has_xml_docs && masked.doc_only[l]) {
            std::string lower = to_lower(masked.doc_comments[l]);
            metrics.has_xml_docs = lower.find("<summary>") != std::string::npos;
        }
    }
    for (size_t k = 0; k + 1 < tokens.size(); ++k) {
        const std::string& x = tokens[k].text;
        if (tokens[k + 1].text == "(" && (x == "if" || x == "for" || x == "while" || x == "switch")) {
            ++metrics.branch_points;
        }
    }

    DeclarationScanner scanner(masked, tokens, doc);
    scanner.run();

    std::stable_sort(doc.warnings.begin(), doc.warnings.end(),
        [](const ParseWarning& a, const ParseWarning& b) { return a.start_line < b.start_line; });
    return doc;
}

} // namespace sharpmap
