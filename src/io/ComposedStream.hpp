#pragma once
#include <memory>

#include "ReadStream.hpp"

// Exclusive owner of a base layer (plain file or decrypted object) and an optional
// compression layer reading from it. Without compression both roles are the same object.
class ComposedStream : public ReadStream {
    public:
    // decoder may be nullptr (identity); if set, it must read from *base
    ComposedStream(std::unique_ptr<ReadStream> base, std::unique_ptr<ReadStream> decoder);

    size_t read(void* buf, size_t count) override;

    // closes the compression layer, then the base layer unless it is the same object
    void close() override;

    ReadStream& compression_layer() { return *m_compress; }
    ReadStream& base_layer() { return *m_base; }
    bool layers_aliased() const { return m_compress == m_base.get(); }

    private:
    // declaration order matters: the decoder is destroyed before the base it reads from
    std::unique_ptr<ReadStream> m_base;
    std::unique_ptr<ReadStream> m_decoder;
    ReadStream* m_compress;
    bool m_closed = false;
};
