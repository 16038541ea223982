#ifndef CHAT_CONSOLE_H
#define CHAT_CONSOLE_H

#include "shared_common_util.h"
#include "shared_net_common_protocol.h"

#include <iostream>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

// Where a send turn gets its plaintext. std::nullopt means input is exhausted.
class LineSource
{
  public:
    virtual ~LineSource() = default;
    virtual std::optional<std::string> read_line() = 0;
};

// Where a receive turn delivers decoded plaintext.
class LineSink
{
  public:
    virtual ~LineSink() = default;
    virtual void write_line(std::string_view line) = 0;
};

// Reads one line per call. At most max_line bytes of a line are kept; the rest
// is discarded, so a caller checking against a cap of max_line - 1 still sees
// an overlong line without it ever being held whole.
class ConsoleLineSource final : public LineSource
{
  public:
    ConsoleLineSource(std::istream &in, std::ostream &prompt_out,
                      size_t max_line = MAX_ENVELOPE_LEN + 1)
        : in_(in), prompt_out_(prompt_out), max_line_(max_line)
    {
    }

    std::optional<std::string> read_line() override
    {
        prompt_out_ << "[CHAT] Type message:\n> " << std::flush;

        std::string line;
        bool        got_any   = false;
        bool        truncated = false;
        for (int ch = in_.get(); ch != std::char_traits<char>::eof();
             ch     = in_.get())
        {
            got_any = true;
            if (ch == '\n')
                break;
            if (line.size() < max_line_)
                line.push_back(static_cast<char>(ch));
            else
                truncated = true;
        }

        if (!got_any)
        {
            prompt_out_ << "\n";
            return std::nullopt;
        }
        if (truncated)
            return line;
        return trim(std::move(line));
    }

  private:
    std::istream &in_;
    std::ostream &prompt_out_;
    size_t        max_line_;
};

class ConsoleLineSink final : public LineSink
{
  public:
    ConsoleLineSink(std::ostream &out, std::string_view peer_label)
        : out_(out), label_(peer_label)
    {
    }

    void write_line(std::string_view line) override
    {
        out_ << "[" << label_ << "] " << trim(std::string(line)) << "\n\n"
             << std::flush;
    }

  private:
    std::ostream &out_;
    std::string   label_;
};

#endif
