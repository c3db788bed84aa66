#include "../include/private_analytics/phi_detector.hpp"

#include <google/protobuf/util/json_util.h>

#include <boost/variant.hpp>

#include <sstream>
#include <stdexcept>

namespace private_analytics {

namespace {

struct PatternSource {
    PhiCategory category;
    const char* expression;
};

// checked in order; the first match decides the reported category
const PatternSource kMaintainedPatterns[] = {
        // millisecond-precision timestamps
        {PhiCategory::MillisecondTimestamp, R"(\b1\d{12}\b)"},
        {PhiCategory::MillisecondTimestamp, R"(\d{4}-\d{2}-\d{2}[T ]\d{2}:\d{2}:\d{2}[.,]\d{3})"},
        {PhiCategory::MillisecondTimestamp, R"(\b\d{2}:\d{2}:\d{2}[.,]\d{3}\b)"},

        // precise coordinates
        {PhiCategory::PreciseCoordinates, R"re((?:lat|latitude|lon|lng|longitude)"?\s*[:=]\s*"?-?\d{1,3}\.\d{3,})re"},
        {PhiCategory::PreciseCoordinates, R"(-?\d{1,2}\.\d{4,}\s*,\s*-?\d{1,3}\.\d{4,})"},

        // assessment scores, crisis content, clinical vocabulary
        {PhiCategory::ClinicalTerminology, R"(\b(?:PHQ|GAD)[-\s]?[79]\s*[:=]?\s*\d{1,2}\b)"},
        {PhiCategory::ClinicalTerminology, R"(\b(?:suicide|suicidal|kill\s+(?:myself|yourself)|self[- ]?harm|end\s+(?:my\s+life|it\s+all))\b)"},
        {PhiCategory::ClinicalTerminology, R"(\b(?:diagnos(?:is|ed)|prescri(?:bed|ption)|medication|dosage|bipolar|schizophreni[ac]|ptsd)\b)"},
        {PhiCategory::ClinicalTerminology, R"(\b(?:score|total|result)\s*[:=]?\s*\d{1,2}\b)"},

        // direct identifiers
        {PhiCategory::DirectIdentifier, R"(\b[\w.%+-]+@[\w.-]+\.[a-z]{2,}\b)"},
        {PhiCategory::DirectIdentifier, R"(\b\d{3}[-.\s]?\d{2}[-.\s]?\d{4}\b)"},
        {PhiCategory::DirectIdentifier, R"(\b(?:\+?1[-.\s]?)?\(?\d{3}\)?[-.\s]?\d{3}[-.\s]?\d{4}\b)"},
        {PhiCategory::DirectIdentifier, R"((?:^|[^\w])\+\d{1,3}[-.\s]?\(?\d{1,4}\)?[-.\s]?\d{1,4}[-.\s]?\d{1,9}\b)"},

        // persistent identifiers
        {PhiCategory::PersistentIdentifier, R"(\b[0-9a-f]{8}-[0-9a-f]{4}-[0-9a-f]{4}-[0-9a-f]{4}-[0-9a-f]{12}\b)"},
        {PhiCategory::PersistentIdentifier, R"(\b(?:[0-9a-f]{2}:){5}[0-9a-f]{2}\b)"},
        {PhiCategory::PersistentIdentifier, R"(\b(?:\d{1,3}\.){3}\d{1,3}\b)"},
        {PhiCategory::PersistentIdentifier, R"(\b\d{10,}\b)"},
};

// appends the UTF-8 encoding of a code point
void appendUtf8(std::string& out, unsigned int codePoint) {
    if (codePoint < 0x80) {
        out += static_cast<char>(codePoint);
    } else if (codePoint < 0x800) {
        out += static_cast<char>(0xC0 | (codePoint >> 6));
        out += static_cast<char>(0x80 | (codePoint & 0x3F));
    } else if (codePoint < 0x10000) {
        out += static_cast<char>(0xE0 | (codePoint >> 12));
        out += static_cast<char>(0x80 | ((codePoint >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (codePoint & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (codePoint >> 18));
        out += static_cast<char>(0x80 | ((codePoint >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((codePoint >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (codePoint & 0x3F));
    }
}

// invisible Unicode format characters (category Cf) that split a term without showing
bool isFormatCharacter(unsigned int codePoint) {
    return codePoint == 0x00AD || codePoint == 0x034F || codePoint == 0x061C || codePoint == 0x180E
           || (codePoint >= 0x200B && codePoint <= 0x200F)
           || (codePoint >= 0x202A && codePoint <= 0x202E)
           || (codePoint >= 0x2060 && codePoint <= 0x2064)
           || (codePoint >= 0x2066 && codePoint <= 0x206F)
           || codePoint == 0xFEFF
           || (codePoint >= 0xFFF9 && codePoint <= 0xFFFB)
           || (codePoint >= 0xE0000 && codePoint <= 0xE007F);
}

bool parseHex4(const std::string& text, std::size_t at, unsigned int& value) {
    if (at + 4 > text.size()) return false;
    value = 0;
    for (std::size_t j = at; j < at + 4; ++j) {
        char c = text[j];
        value <<= 4;
        if (c >= '0' && c <= '9') value |= static_cast<unsigned int>(c - '0');
        else if (c >= 'a' && c <= 'f') value |= static_cast<unsigned int>(c - 'a' + 10);
        else if (c >= 'A' && c <= 'F') value |= static_cast<unsigned int>(c - 'A' + 10);
        else return false;
    }
    return true;
}

// a \uXXXX escape as written by the JSON renderer, surrogate pairs included;
// returns the number of bytes consumed, 0 when there is no escape at i
std::size_t decodeJsonEscape(const std::string& text, std::size_t i, unsigned int& codePoint) {
    if (text.compare(i, 2, "\\u") != 0 || !parseHex4(text, i + 2, codePoint)) return 0;
    if (codePoint < 0xD800 || codePoint > 0xDBFF) return 6;

    unsigned int low;
    if (text.compare(i + 6, 2, "\\u") == 0 && parseHex4(text, i + 8, low) && low >= 0xDC00 && low <= 0xDFFF) {
        codePoint = 0x10000 + ((codePoint - 0xD800) << 10) + (low - 0xDC00);
        return 12;
    }
    return 6;
}

// returns the sequence length, 0 for a malformed or truncated sequence
std::size_t decodeUtf8(const std::string& text, std::size_t i, unsigned int& codePoint) {
    auto lead = static_cast<unsigned char>(text[i]);
    std::size_t length;

    if (lead < 0x80) { codePoint = lead; length = 1; }
    else if ((lead & 0xE0) == 0xC0) { codePoint = lead & 0x1F; length = 2; }
    else if ((lead & 0xF0) == 0xE0) { codePoint = lead & 0x0F; length = 3; }
    else if ((lead & 0xF8) == 0xF0) { codePoint = lead & 0x07; length = 4; }
    else return 0;

    if (i + length > text.size()) return 0;
    for (std::size_t j = 1; j < length; ++j) {
        auto next = static_cast<unsigned char>(text[i + j]);
        if ((next & 0xC0) != 0x80) return 0;
        codePoint = (codePoint << 6) | (next & 0x3F);
    }
    return length;
}

struct ScanValueWriter : public boost::static_visitor<std::string> {
    std::string operator()(double value) const {
        std::ostringstream stream;
        stream.precision(15);
        stream << value;
        return stream.str();
    }
    std::string operator()(const std::string& value) const { return value; }
    std::string operator()(bool value) const { return value ? "true" : "false"; }
};

} // namespace

std::string phiCategoryName(PhiCategory category) {
    switch (category) {
        case PhiCategory::None: return "none";
        case PhiCategory::DirectIdentifier: return "direct_identifier";
        case PhiCategory::ClinicalTerminology: return "clinical_terminology";
        case PhiCategory::PersistentIdentifier: return "persistent_identifier";
        case PhiCategory::PreciseCoordinates: return "precise_coordinates";
        case PhiCategory::MillisecondTimestamp: return "millisecond_timestamp";
    }
    return "unknown";
}

std::string normalizeForScan(const std::string& text) {
    std::string out;
    out.reserve(text.size());

    std::size_t i = 0;
    while (i < text.size()) {
        unsigned int codePoint;
        std::size_t length = decodeJsonEscape(text, i, codePoint);
        if (length == 0) length = decodeUtf8(text, i, codePoint);
        if (length == 0) {
            out += text[i];
            ++i;
            continue;
        }
        i += length;

        if (isFormatCharacter(codePoint))
            continue;
        if (codePoint >= 0xFF01 && codePoint <= 0xFF5E)
            out += static_cast<char>(codePoint - 0xFF01 + 0x21);
        else if (codePoint == 0x3000 || codePoint == 0x00A0)
            out += ' ';
        else if (codePoint == 0x2010 || codePoint == 0x2011 || codePoint == 0x2012
                 || codePoint == 0x2013 || codePoint == 0x2212)
            out += '-';
        else
            appendUtf8(out, codePoint);
    }
    return out;
}

std::string serializeForScan(const proto::AnonymizedEvent& event) {
    std::string json;
    google::protobuf::util::JsonPrintOptions options;
    options.preserve_proto_field_names = true;
    if (!google::protobuf::util::MessageToJsonString(event, &json, options).ok())
        throw std::runtime_error("anonymized event cannot be rendered for scanning");
    return json;
}

std::string serializeForScan(const GeneralizedEvent& event) {
    std::string text = eventTypeTag(event.type);
    for (const auto& field : event.fields)
        text += " " + field.first + "=" + boost::apply_visitor(ScanValueWriter(), field.second);
    return text;
}

PhiDetector::PhiDetector() {
    for (const auto& source : kMaintainedPatterns)
        add_pattern(source.category, source.expression);
}

void PhiDetector::add_pattern(PhiCategory category, const std::string& expression) {
    this->_patterns.push_back({category, std::regex(expression, std::regex::ECMAScript | std::regex::icase)});
}

PhiCategory PhiDetector::scan(const std::string& text) const {
    std::string normalized = normalizeForScan(text);
    for (const auto& pattern : this->_patterns)
        if (std::regex_search(normalized, pattern.expression)) return pattern.category;
    return PhiCategory::None;
}

} // namespace private_analytics
