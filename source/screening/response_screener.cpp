#include "screening/response_screener.hpp"

#include <algorithm>
#include <cctype>

namespace response_screener {

namespace {

struct Pattern {
    const char *phrase;
    double weight;
    const char *label;
};

const Pattern INJECTION_PATTERNS[] = {
    {"ignore previous instructions", 0.6, "instruction override"},
    {"ignore all previous", 0.6, "instruction override"},
    {"disregard the above", 0.5, "instruction override"},
    {"disregard previous", 0.5, "instruction override"},
    {"forget your instructions", 0.5, "instruction override"},
    {"new instructions:", 0.3, "instruction override"},
    {"you are now", 0.25, "role hijack"},
    {"act as the system", 0.4, "role hijack"},
    {"system prompt", 0.2, "system prompt reference"},
    {"<script", 0.5, "script payload"},
    {"javascript:", 0.4, "script payload"},
};

// Zero-width and bidirectional control characters, UTF-8 encoded.
const char *const HIDDEN_SEQUENCES[] = {
    "\xE2\x80\x8B", // U+200B zero width space
    "\xE2\x80\x8C", // U+200C zero width non-joiner
    "\xE2\x80\x8D", // U+200D zero width joiner
    "\xE2\x81\xA0", // U+2060 word joiner
    "\xE2\x80\xAE", // U+202E right-to-left override
    "\xE2\x81\xA6", // U+2066 left-to-right isolate
    "\xEF\xBB\xBF", // U+FEFF byte order mark
};

std::string to_lower(const std::string &input) {
    std::string result = input;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char character) { return static_cast<char>(std::tolower(character)); });
    return result;
}

// Markdown image whose URL carries a query string: ![x](https://host/p?data=...)
bool has_exfiltration_image(const std::string &lowered) {
    std::size_t position = 0;
    while ((position = lowered.find("![", position)) != std::string::npos) {
        std::size_t link_start = lowered.find("](", position);
        if (link_start == std::string::npos) {
            return false;
        }
        std::size_t link_end = lowered.find(')', link_start);
        std::string link = lowered.substr(link_start + 2, link_end == std::string::npos
                                                              ? std::string::npos
                                                              : link_end - link_start - 2);
        if (link.rfind("http", 0) == 0 && link.find('?') != std::string::npos) {
            return true;
        }
        position = link_start + 2;
    }
    return false;
}

} // namespace

ScreeningResult screen(const std::string &text, const ScreeningConfig &config) {
    ScreeningResult result;
    double score = 0.0;
    std::string lowered = to_lower(text);

    if (config.detect_injection) {
        for (const auto &pattern : INJECTION_PATTERNS) {
            if (lowered.find(pattern.phrase) != std::string::npos) {
                score += pattern.weight;
                result.findings.push_back(std::string(pattern.label) + ": \"" + pattern.phrase + "\"");
            }
        }
    }

    if (config.detect_hidden_text) {
        for (const char *sequence : HIDDEN_SEQUENCES) {
            if (text.find(sequence) != std::string::npos) {
                score += 0.3;
                result.findings.push_back("hidden or direction-changing characters");
                break;
            }
        }
    }

    if (config.detect_exfiltration && has_exfiltration_image(lowered)) {
        score += 0.5;
        result.findings.push_back("markdown image with query string (possible exfiltration)");
    }

    if (config.max_response_length > 0 && text.size() > config.max_response_length) {
        score += 0.2;
        result.findings.push_back("response exceeds " + std::to_string(config.max_response_length) + " bytes");
    }

    result.risk_score = std::min(score, 1.0);
    result.passed = result.risk_score < config.risk_threshold;
    return result;
}

} // namespace response_screener
