#include <console/logger.hpp>

using namespace i8042::common;
using namespace i8042::console;

bool Logger::s_debugEnabled = false;
LogSink Logger::s_sink = 0;

void Logger::Line::AppendChar(char c)
{
    if (m_len >= MAX_LINE - 1) return;
    m_buf[m_len++] = c;
    m_buf[m_len] = 0;
}

void Logger::Line::Append(const char* s)
{
    if (s == 0) return;
    while (*s) AppendChar(*s++);
}

void Logger::Line::AppendHex(uint8_t v)
{
    const char* hex = "0123456789ABCDEF";
    AppendChar('0');
    AppendChar('x');
    AppendChar(hex[(v >> 4) & 0xF]);
    AppendChar(hex[v & 0xF]);
}

void Logger::Line::PadTo(int col)
{
    // Always at least one space between message and status
    do {
        AppendChar(' ');
    } while (m_len < col && m_len < MAX_LINE - 1);
}

void Logger::Emit(const Line& line)
{
    if (s_sink == 0) return;
    s_sink(line.CStr());
}

void Logger::Log(const char* msg)
{
    Line line;
    line.Append(msg);
    Emit(line);
}

void Logger::LogKV(const char* key, const char* value)
{
    Line line;
    line.Append(key);
    line.Append(": ");
    line.Append(value);
    Emit(line);
}

void Logger::LogHex(const char* key, uint8_t value)
{
    Line line;
    line.Append(key);
    line.Append(": ");
    line.AppendHex(value);
    Emit(line);
}

void Logger::LogStatus(const char* msg, bool ok)
{
    Line line;
    line.Append(msg);
    line.PadTo(STATUS_COL);
    line.Append(ok ? "[ OK ]" : "[FAIL]");
    Emit(line);
}
