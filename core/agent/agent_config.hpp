#pragma once

#include <string>
#include <vector>

namespace agentlink {
namespace agent {

// Prompt used when the config does not override it. Responses are read aloud, so the agent is
// told to avoid markup.
inline const char *default_system_prompt() {
    return "You are a helpful assistant being used via voice commands.\n\n"
           "CRITICAL: Your responses will be read aloud via text-to-speech. Follow these rules STRICTLY:\n\n"
           "1. NO MARKDOWN - Never use *, **, #, `, [], (), or any markdown formatting\n"
           "2. NO EMOJIS - Never include emojis in your response\n"
           "3. NO SYMBOLS - Use words: say \"degrees\" not the degree sign, \"percent\" not the percent sign\n"
           "4. Keep it conversational - Write exactly how you would speak it aloud\n"
           "5. Be concise - Voice responses should be brief and to the point\n\n"
           "When describing code: Just say what you did, not file paths or syntax.\n"
           "When providing information: Present facts naturally as sentences, no bullet points.";
}

struct AgentConfig {
    std::string command = "claude";            // Agent CLI executable (PATH lookup if no '/')
    std::vector<std::string> args;             // Extra args appended after the fixed startup args
    std::string working_directory;             // Child cwd (empty = inherit)
    std::vector<std::string> allowed_tools{"Bash", "Read", "Edit", "Write", "Glob", "Grep"};
    std::string permission_mode = "bypassPermissions";
    std::string system_prompt = default_system_prompt();

    int startup_settle_ms = 200;     // Pause after spawn before the first write
    int shutdown_timeout_ms = 2000;  // Graceful terminate window before SIGKILL
    int kill_timeout_ms = 1000;      // Reap window after SIGKILL on the interrupt path
    int poll_interval_ms = 50;       // Max blocking time of one stdout read
    int write_timeout_ms = 5000;     // Per-line write timeout
};

}  // namespace agent
}  // namespace agentlink
