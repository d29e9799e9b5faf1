#pragma once

#include "utils/logger_sinks/sink.hpp"

#include <cstdio>

namespace artbus::utils
{

class ConsoleSink : public Sink
{
  public:
    void write(const LogMessage &msg) override
    {
        fmt::print(stderr, "{}", Sink::render(msg));
    }
    void flush() override { std::fflush(stderr); }
    std::string description() const override { return "Console"; }
};

} // namespace artbus::utils
