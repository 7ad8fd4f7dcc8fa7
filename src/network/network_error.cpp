#include "peerdrop/network/network_error.hpp"

namespace peerdrop {
namespace network {

namespace {

class NetworkCategory : public boost::system::error_category {
public:
  const char* name() const noexcept override {
    return "peerdrop.network";
  }

  std::string message(int value) const override {
    return network_error_to_string(static_cast<NetworkError>(value));
  }
};

} // namespace

const boost::system::error_category& network_category() {
  static const NetworkCategory category;
  return category;
}

} // namespace network
} // namespace peerdrop
