#pragma once

#include <stdexcept>
#include <string>

namespace synthflat {

class SynthFlatError : public std::runtime_error {
public:
    explicit SynthFlatError(const std::string& message)
        : std::runtime_error(message) {}
};

class ConfigError : public SynthFlatError {
public:
    explicit ConfigError(const std::string& message)
        : SynthFlatError("Config error: " + message) {}
};

class ValidationError : public SynthFlatError {
public:
    explicit ValidationError(const std::string& message)
        : SynthFlatError("Validation error: " + message) {}
};

class IOError : public SynthFlatError {
public:
    explicit IOError(const std::string& message)
        : SynthFlatError("I/O error: " + message) {}
};

class FitsError : public IOError {
public:
    explicit FitsError(const std::string& message)
        : IOError("FITS error: " + message) {}
};

class TiffError : public IOError {
public:
    explicit TiffError(const std::string& message)
        : IOError("TIFF error: " + message) {}
};

// Recoverable: the frame is excluded unless strict mode is set
class FrameDecodeError : public IOError {
public:
    explicit FrameDecodeError(const std::string& message)
        : IOError("Decode error: " + message) {}
};

class UnsupportedPatternError : public SynthFlatError {
public:
    explicit UnsupportedPatternError(const std::string& message)
        : SynthFlatError("Unsupported mosaic pattern: " + message) {}
};

class GeometryMismatchError : public SynthFlatError {
public:
    explicit GeometryMismatchError(const std::string& message)
        : SynthFlatError("Geometry mismatch: " + message) {}
};

class EmptyBatchError : public SynthFlatError {
public:
    explicit EmptyBatchError(const std::string& message)
        : SynthFlatError("Empty batch: " + message) {}
};

class PatternCoverageError : public SynthFlatError {
public:
    explicit PatternCoverageError(const std::string& message)
        : SynthFlatError("Pattern coverage error: " + message) {}
};

class ExternalToolError : public SynthFlatError {
public:
    explicit ExternalToolError(const std::string& message)
        : SynthFlatError("External tool error: " + message) {}
};

class MissingRequiredMetadataError : public SynthFlatError {
public:
    explicit MissingRequiredMetadataError(const std::string& message)
        : SynthFlatError("Missing required metadata: " + message) {}
};

class PipelineError : public SynthFlatError {
public:
    explicit PipelineError(const std::string& message)
        : SynthFlatError("Pipeline error: " + message) {}
};

class StopRequested : public SynthFlatError {
public:
    StopRequested() : SynthFlatError("Stop requested by user") {}
};

} // namespace synthflat
