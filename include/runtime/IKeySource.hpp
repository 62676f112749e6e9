#pragma once

namespace blockdrop::runtime {

/// Byte-level keyboard access used by the input producer and the replay runner.
class IKeySource {
public:
    virtual ~IKeySource() = default;

    /// Number of bytes that can be read without blocking.
    virtual int available() = 0;

    /// Next byte (0..255), or -1 when the source is closed or failed.
    virtual int read() = 0;
};

} // namespace blockdrop::runtime
