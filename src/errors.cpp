#include "errors.hpp"

const char* to_string(ErrorKind kind) {
  switch(kind) {
    case ErrorKind::Client: return "client";
    case ErrorKind::Auth: return "auth";
    case ErrorKind::NotFound: return "not-found";
    case ErrorKind::Quota: return "quota";
    case ErrorKind::Integrity: return "integrity";
    case ErrorKind::Transport: return "transport";
    case ErrorKind::Configuration: return "configuration";
    default: return "internal";
  }
}

int http_status_for(ErrorKind kind) {
  switch(kind) {
    case ErrorKind::Client: return 400;
    case ErrorKind::Auth: return 403;
    case ErrorKind::NotFound: return 404;
    case ErrorKind::Quota: return 429;
    case ErrorKind::Integrity: return 400;
    case ErrorKind::Transport: return 502;
    default: return 500;
  }
}
