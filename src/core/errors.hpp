#pragma once
#include <stdexcept>
#include <string>

// Every error raised while decoding or inspecting a backup is terminal for the invocation.
class BakError : public std::runtime_error {
    public:
    explicit BakError(const std::string& msg) : std::runtime_error(msg) {}
};

// PEM can't be read or parsed
class KeyResolutionError : public BakError {
    public:
    explicit KeyResolutionError(const std::string& msg) : BakError(msg) {}
};

// key is passphrase-encrypted, but no passphrase was given
class PassphraseRequiredError : public BakError {
    public:
    explicit PassphraseRequiredError(const std::string& msg) : BakError(msg) {}
};

class SourceNotFoundError : public BakError {
    public:
    explicit SourceNotFoundError(const std::string& msg) : BakError(msg) {}
};

// bad compression header, or the encryption layer can't be opened
class DecodeInitError : public BakError {
    public:
    explicit DecodeInitError(const std::string& msg) : BakError(msg) {}
};

class CreateTargetError : public BakError {
    public:
    explicit CreateTargetError(const std::string& msg) : BakError(msg) {}
};

class CopyError : public BakError {
    public:
    explicit CopyError(const std::string& msg) : BakError(msg) {}
};

class MalformedFooterError : public BakError {
    public:
    explicit MalformedFooterError(const std::string& msg) : BakError(msg) {}
};

class SegmentReadError : public BakError {
    public:
    explicit SegmentReadError(const std::string& msg) : BakError(msg) {}
};
