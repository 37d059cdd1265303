#include <resplite/proto/value.hpp>

namespace resplite {

    bool operator==(const RespValue& a, const RespValue& b) {
        if (a.kind != b.kind) return false;
        if (a.kind == RespValue::Kind::Str) return a.s == b.s;
        return a.items == b.items;
    }

} // namespace resplite
