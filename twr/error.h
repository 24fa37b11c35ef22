#ifndef TREEWRANGLER_ERROR_H
#define TREEWRANGLER_ERROR_H
#include <string>
#include <exception>
#include <sstream>

namespace twr {

class TWRError : public std::exception {
    protected:
    std::string message;
    public:
    const char * what() const noexcept {
        return message.c_str();
    }
    template <typename T> TWRError& operator<<(const T&);
    void prepend(const std::string& s) {
        message = s + message;
    }
    TWRError() noexcept {}
    TWRError(const std::string & msg) noexcept :message(msg) {}
};

template <typename T>
TWRError& TWRError::operator<<(const T& t) {
  std::ostringstream oss;
  oss << message << t;
  message = oss.str();
  return *this;
}

// Raised when a monophyly query has an empty target set, or when none of the
//  targets label a leaf of the tree.
class TWRClassifierError : public TWRError {
    public:
    TWRClassifierError() noexcept {}
    TWRClassifierError(const std::string & msg) noexcept :TWRError(msg) {}
};

// Raised for structural requests that the tree model does not support
//  (deleting the root node).
class TWRUnsupportedOperation : public TWRError {
    public:
    TWRUnsupportedOperation() noexcept {}
    TWRUnsupportedOperation(const std::string & msg) noexcept :TWRError(msg) {}
};

} //namespace twr
#endif
