#pragma once

namespace catalog {

inline constexpr const char* kServiceName = "catalog-service";
inline constexpr const char* kServiceVersion = "1.0.0";

} // namespace catalog
