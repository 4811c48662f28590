#include "wrx_text_encoding.h"
#include "../../utils/wrx_exceptions.h"

#include <podofo/podofo.h>

using namespace PoDoFo;

namespace {

  PdfEncodingMapConstPtr predefined_map(const wrx_string& name)
  {
    if (name == "WinAnsiEncoding") return PdfEncodingMapFactory::WinAnsiEncodingInstance();
    if (name == "MacRomanEncoding") return PdfEncodingMapFactory::MacRomanEncodingInstance();
    if (name == "MacExpertEncoding") return PdfEncodingMapFactory::MacExpertEncodingInstance();
    if (name == "StandardEncoding") return PdfEncodingMapFactory::StandardEncodingInstance();
    return nullptr;
  }

}

bool wrx_text_decoder::is_supported(const wrx_string& encoding_name)
{
  return predefined_map(encoding_name) != nullptr;
}

wrx_text_decoder::wrx_text_decoder(const wrx_string& encoding_name)
  : encoding_name(encoding_name)
{
  PdfEncodingMapConstPtr map = predefined_map(encoding_name);
  if (map == nullptr) {
    throw wrx_encoding_error("unsupported text encoding: " + encoding_name);
  }
  encoding = std::make_unique<PdfEncoding>(map);
}

wrx_text_decoder::~wrx_text_decoder() = default;

wrx_string wrx_text_decoder::decode(const std::string& raw) const
{
  if (raw.empty()) {
    return wrx_string();
  }
  PdfString encoded = PdfString::FromRaw(bufferview(raw.data(), raw.size()));
  return wrx_string(encoding->ConvertToUtf8(encoded));
}
