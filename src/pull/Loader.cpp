#include "Loader.hpp"

CFunctionLoader::CFunctionLoader(std::function<void()> fn) : m_fn(std::move(fn)) {
    ;
}

void CFunctionLoader::load() {
    if (m_fn)
        m_fn();
}
