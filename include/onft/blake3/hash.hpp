#pragma once
#include <onft/schema/primitives.hpp>
#include <cstdint>
#include <span>
#include <string_view>

namespace onft::blake3 {

onft::schema::hash32_t hash(const std::string_view& str);
onft::schema::hash32_t hash(const onft::schema::bytes_view_t& bytes);

}  // namespace onft::blake3
