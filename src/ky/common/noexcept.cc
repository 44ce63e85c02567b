#include <glog/logging.h>
#include <ky/noexcept.h>

#include <typeinfo>

namespace ky {

int NoExcept(const std::function<int()> &function) {
  try {
    return function();
  } catch (std::exception &e) {
    LOG(ERROR) << typeid(e).name() << ": " << e.what();
    return 1;
  } catch (...) {
    LOG(ERROR) << "unknown exception";
    return 2;
  }
}

}  // namespace ky
