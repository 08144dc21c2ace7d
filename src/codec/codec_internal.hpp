#pragma once

#include "jarstore/codec/codec.hpp"

#include <memory>

namespace jarstore::codec {

std::unique_ptr<Codec> NewRawCodec();
Result<std::unique_ptr<Codec>> NewZstdCodec(int level, Slice dictionary);
std::unique_ptr<Codec> NewLz4Codec();

} // namespace jarstore::codec
