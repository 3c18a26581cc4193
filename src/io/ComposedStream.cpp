#include "ComposedStream.hpp"

#include <stdexcept>

ComposedStream::ComposedStream(std::unique_ptr<ReadStream> base, std::unique_ptr<ReadStream> decoder)
    : m_base(std::move(base)), m_decoder(std::move(decoder)) {
    if( !m_base ){
        throw std::invalid_argument("ComposedStream: base layer is required");
    }
    m_compress = m_decoder ? m_decoder.get() : m_base.get();
}

size_t ComposedStream::read(void* buf, size_t count) {
    return m_compress->read(buf, count);
}

void ComposedStream::close() {
    if( m_closed ){
        return;
    }
    m_closed = true;

    // if this throws, the base layer is still released by its destructor
    m_compress->close();
    if( m_compress != m_base.get() ){
        m_base->close();
    }
}
