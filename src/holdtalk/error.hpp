#pragma once

#include <expected>
#include <string>
#include <utility>

enum class ErrorKind {
    Device,         // microphone unavailable
    Transcription,  // network, timeout, bad status or body
    EmptyResult,    // backend returned nothing to type
    Configuration,  // startup configuration invalid
    Input,          // hotkey device unavailable
    Output,         // text injection failed
};

struct Error {
    ErrorKind kind;
    std::string message;
};

template <typename T>
using Result = std::expected<T, Error>;

inline std::unexpected<Error> make_error(ErrorKind kind, std::string message) {
    return std::unexpected<Error>(Error{kind, std::move(message)});
}

inline const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Device: return "device error";
        case ErrorKind::Transcription: return "transcription error";
        case ErrorKind::EmptyResult: return "empty result";
        case ErrorKind::Configuration: return "configuration error";
        case ErrorKind::Input: return "input error";
        case ErrorKind::Output: return "output error";
    }
    return "error";
}
