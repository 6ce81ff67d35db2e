#ifndef WEBPUPPET_MCP_RESPONSE_SCREENER_HPP
#define WEBPUPPET_MCP_RESPONSE_SCREENER_HPP

// Heuristic screening of text returned by AI providers before it is handed
// back to the MCP peer (prompt injection, hidden text, exfiltration links).

#include <cstddef>
#include <string>
#include <vector>

namespace response_screener {

struct ScreeningConfig {
    double risk_threshold = 0.5;   // passed == (risk_score < risk_threshold)
    bool detect_injection = true;
    bool detect_hidden_text = true;
    bool detect_exfiltration = true;
    std::size_t max_response_length = 200000; // bytes
};

struct ScreeningResult {
    bool passed = true;
    double risk_score = 0.0;             // 0.0 - 1.0
    std::vector<std::string> findings;   // one line per matched heuristic
};

ScreeningResult screen(const std::string &text, const ScreeningConfig &config);

} // namespace response_screener

#endif // WEBPUPPET_MCP_RESPONSE_SCREENER_HPP
