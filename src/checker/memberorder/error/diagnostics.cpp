#include "memberorder/error/diagnostics.hpp"

namespace memberorder::error {
  Diagnostics diag;
}
