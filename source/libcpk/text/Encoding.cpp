#include "Encoding.hpp"

#include <cerrno>
#include <iconv.h>

namespace libcpk::text {

namespace {

struct IconvCloser {
  void operator()(iconv_t cd) const { iconv_close(cd); }
};
using IconvHandle =
    std::unique_ptr<std::remove_pointer_t<iconv_t>, IconvCloser>;

Result<IconvHandle> OpenIconv(const std::string& to, const std::string& from) {
  iconv_t cd = iconv_open(to.c_str(), from.c_str());
  if (cd == reinterpret_cast<iconv_t>(-1)) {
    return std::unexpected(fmt::format("iconv cannot convert {} to {}: {}",
                                       from, to, std::strerror(errno)));
  }
  return IconvHandle(cd);
}

Result<std::string> Convert(const std::string& to, const std::string& from,
                            std::span<const u8> in) {
  auto cd = TRY(OpenIconv(to, from));

  std::string out(in.size() * 4 + 16, '\0');
  auto* in_ptr = const_cast<char*>(reinterpret_cast<const char*>(in.data()));
  std::size_t in_left = in.size();
  std::size_t written = 0;

  while (in_left > 0) {
    char* out_ptr = out.data() + written;
    std::size_t out_left = out.size() - written;
    const std::size_t rc =
        iconv(cd.get(), &in_ptr, &in_left, &out_ptr, &out_left);
    written = out.size() - out_left;
    if (rc != static_cast<std::size_t>(-1))
      break;

    if (errno == E2BIG) {
      out.resize(out.size() * 2);
      continue;
    }
    const auto at = in.size() - in_left;
    if (errno == EINVAL) {
      return std::unexpected(fmt::format(
          "Truncated {} sequence at byte {} of {}", from, at, in.size()));
    }
    return std::unexpected(fmt::format("Invalid {} sequence at byte {} of {}",
                                       from, at, in.size()));
  }

  out.resize(written);
  return out;
}

} // namespace

Result<CodePageConverter> CodePageConverter::Create(std::string_view encoding) {
  std::string name(encoding);
  TRY(OpenIconv("UTF-8", name));
  TRY(OpenIconv(name, "UTF-8"));
  return CodePageConverter(std::move(name));
}

Result<std::string> CodePageConverter::decode(std::span<const u8> bytes) const {
  return Convert("UTF-8", mEncoding, bytes);
}

Result<std::vector<u8>> CodePageConverter::encode(std::string_view utf8) const {
  auto converted = TRY(Convert(
      mEncoding, "UTF-8",
      std::span<const u8>(reinterpret_cast<const u8*>(utf8.data()),
                          utf8.size())));
  return std::vector<u8>(converted.begin(), converted.end());
}

std::string AsciiToLower(std::string_view str) {
  std::string out(str);
  for (auto& c : out) {
    if (c >= 'A' && c <= 'Z')
      c = static_cast<char>(c - 'A' + 'a');
  }
  return out;
}

} // namespace libcpk::text
