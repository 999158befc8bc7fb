#include "stream/block_source.hpp"

const char* FetchStatusToString(FetchStatus status) {
  switch (status) {
    case FetchStatus::OK: return "ok";
    case FetchStatus::NOT_FOUND: return "not found";
    case FetchStatus::FAILED: return "failed";
  }
  return "unknown";
}
