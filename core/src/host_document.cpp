#include "dmk/host_document.h"

#include "dmk/log.h"

namespace dmk {

namespace {

template <typename Fn>
bool supported(Fn&& fn) {
  try {
    fn();
    return true;
  } catch (const HostApiError&) {
    return false;
  }
}

} // namespace

HostCapabilities probe_capabilities(IHostDocument& doc) {
  HostCapabilities caps;
  caps.bookmarks = supported([&] { (void)doc.bookmark("DMK___probe"); });
  caps.set_range = supported([&] { doc.set_selection(doc.selection()); });
  caps.find = supported([&] { (void)doc.find("[[DMK:", 0); });
  caps.hidden_font = supported([&] { doc.set_hidden(TextRange{0, 0}, true); });
  caps.tables = supported([&] { (void)doc.count_tables(TextRange{0, doc.length()}); });

  log::debug(std::string("host capabilities: bookmarks=") + (caps.bookmarks ? "1" : "0") +
             " set_range=" + (caps.set_range ? "1" : "0") + " find=" + (caps.find ? "1" : "0") +
             " hidden=" + (caps.hidden_font ? "1" : "0") + " tables=" + (caps.tables ? "1" : "0"));
  return caps;
}

} // namespace dmk
