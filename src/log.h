#ifndef BRICKED_LOG_H_
#define BRICKED_LOG_H_

#include <cstdint>
#include <cstdio>
#include <cstring>
#include <string>

// Emits a single newline-delimited JSON log record to stderr.
//
// Format:
//   {"src":"bricked","event":"<event>","run_id":<run_id>}
//   {"src":"bricked","event":"<event>","run_id":<run_id>,"details":"<escaped>"}
//
// The details string is JSON-escaped: backslashes, quotes, and control
// characters are all safely encoded so the output is always valid JSON.
//
// run_id is the compile job sequence for geometry events and the scene
// generation for scene events; 0 when neither applies.
//
// Query logs with:
//   ./bricked build.bricks 2>build/bricked.log
//   grep '"event":"GEOM_COMPILE_DONE"' build/bricked.log | jq .
//
// Usage:
//   bricked::log_event("GEOM_COMPILE_DONE", seq);
//   bricked::log_event("GEOM_COMPILE_DONE", seq, "duration_ms=123");
//   bricked::log_event("GEOM_COMPILE_FAILED", seq, err.c_str());  // multiline strings are safe

namespace bricked {

inline void log_event(const char *event, uint64_t run_id, const char *details = nullptr) {
  if (!event) return;
  if (details && details[0] != '\0') {
    // Write prefix
    std::fprintf(stderr, "{\"src\":\"bricked\",\"event\":\"%s\",\"run_id\":%llu,\"details\":\"",
                 event, (unsigned long long)run_id);
    // JSON-escape details character by character
    for (const char *p = details; *p != '\0'; ++p) {
      const unsigned char c = (unsigned char)*p;
      if      (c == '"')  std::fputs("\\\"", stderr);
      else if (c == '\\') std::fputs("\\\\", stderr);
      else if (c == '\n') std::fputs("\\n",  stderr);
      else if (c == '\r') std::fputs("\\r",  stderr);
      else if (c == '\t') std::fputs("\\t",  stderr);
      else if (c < 0x20)  std::fprintf(stderr, "\\u%04x", c);
      else                std::fputc(c, stderr);
    }
    std::fputs("\"}\n", stderr);
  } else {
    std::fprintf(stderr, "{\"src\":\"bricked\",\"event\":\"%s\",\"run_id\":%llu}\n",
                 event, (unsigned long long)run_id);
  }
}

inline void log_event(const char *event, uint64_t run_id, const std::string &details) {
  log_event(event, run_id, details.c_str());
}

}  // namespace bricked

#endif  // BRICKED_LOG_H_
