#pragma once

#include "error.hpp"

#include <string>

// Types text into whatever window has keyboard focus.
class TextInjector {
public:
    virtual ~TextInjector() = default;
    virtual Result<void> inject(const std::string& text) = 0;
};
