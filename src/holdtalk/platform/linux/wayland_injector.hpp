#pragma once

#include "output/text_injector.hpp"

// "type" sends the text as key events through wtype. "paste" puts it on the
// clipboard with wl-copy and presses Ctrl+V, or Ctrl+Shift+V for terminals.
class WaylandInjector : public TextInjector {
public:
    enum class Mode { Type, Paste };

    explicit WaylandInjector(Mode mode, bool terminal_paste = false);
    Result<void> inject(const std::string& text) override;

private:
    Result<void> type_direct(const std::string& text);
    Result<void> clipboard_paste(const std::string& text);

    Mode mode_;
    bool terminal_paste_;
};
