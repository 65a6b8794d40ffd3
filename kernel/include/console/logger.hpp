#ifndef __I8042__CONSOLE__LOGGER_H
#define __I8042__CONSOLE__LOGGER_H

#include <common/types.hpp>

using namespace i8042::common;


namespace i8042 {
    
    namespace console {

        // Receives one complete, NUL-terminated line without the trailing newline.
        typedef void (*LogSink)(const char* line);

        class Logger {
    
            public:
                // Longest line handed to the sink; longer messages are truncated.
                static const int MAX_LINE = 128;
                // Column where the '[' of the status should appear
                static const int STATUS_COL = 70;
                // Global debug flag
                static bool s_debugEnabled;
                // Destination for every line; null drops output
                static LogSink s_sink;

                static inline void SetDebugEnabled(bool en) { s_debugEnabled = en; }
                static inline bool IsDebugEnabled() { return s_debugEnabled; }
                static inline void SetSink(LogSink sink) { s_sink = sink; }

                static void Log(const char* msg);

                // Prints: key: value
                static void LogKV(const char* key, const char* value);

                // Prints: key: 0xNN
                static void LogHex(const char* key, uint8_t value);

                // Linux-like status at end of the line: [ OK ] or [FAIL]
                static void LogStatus(const char* msg, bool ok);

                // Debug-level logs (emitted only if s_debugEnabled)
                static inline void Debug(const char* msg) {
                    if (!s_debugEnabled) return;
                    Log(msg);
                }

                static inline void DebugKV(const char* key, const char* value) {
                    if (!s_debugEnabled) return;
                    LogKV(key, value);
                }

                static inline void DebugHex(const char* key, uint8_t value) {
                    if (!s_debugEnabled) return;
                    LogHex(key, value);
                }

            private:
                class Line {
                    public:
                        Line() : m_len(0) { m_buf[0] = 0; }
                        void Append(const char* s);
                        void AppendChar(char c);
                        void AppendHex(uint8_t v);
                        void PadTo(int col);
                        const char* CStr() const { return m_buf; }
                    private:
                        char m_buf[MAX_LINE];
                        int m_len;
                };

                static void Emit(const Line& line);
        };

    }
}

#endif
