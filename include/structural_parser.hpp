#pragma once
#include <string>
#include <vector>
#include "structural_document.hpp"

namespace sharpmap {

// Source text with comments, literals and preprocessor lines blanked out.
// Byte offsets and line breaks line up with the original text, so keywords
// inside a string or comment can never be mistaken for declarations.
struct MaskedSource {
    std::string text;
    std::vector<std::string> doc_comments;  // indexed by line - 1, text after "///"
    std::vector<bool> doc_only;             // line holds nothing but a "///" comment
    std::vector<bool> has_code;
    std::vector<bool> has_comment;
    std::vector<ParseWarning> warnings;
    int line_count = 0;
};

// String literals become runs of kStringMark, char literals runs of kCharMark.
constexpr char kStringMark = '\x01';
constexpr char kCharMark = '\x02';

MaskedSource mask_source(const std::string& content);

// Heuristic C# structure recovery: masking, header scanning and brace
// balance. Never throws on malformed input; problems become ParseWarnings
// inside the returned document.
class StructuralParser {
public:
    static StructuralDocument parse(const std::string& content);
};

} // namespace sharpmap
