#include "web/page.hpp"
#include "web/url.hpp"
#include <sstream>

namespace lanshare {
namespace web {

namespace {

const char* const PAGE_HEAD = R"(<!doctype html>
<html lang="en"><head>
<meta charset="utf-8">
<meta name="viewport" content="width=device-width,initial-scale=1">
<title>Share - Local File Share</title>
<style>
body{margin:0;padding:30px 12px;background:#f7f7fb;font-family:system-ui,-apple-system,"Segoe UI",Roboto,sans-serif;color:#212529}
.card{max-width:1000px;margin:auto;background:#fff;border:1px solid #dee2e6;border-radius:8px;box-shadow:0 1px 3px rgba(0,0,0,.06)}
.header{display:flex;flex-wrap:wrap;justify-content:space-between;align-items:center;gap:12px;padding:16px;border-bottom:1px solid #eee}
.section{padding:16px}
.file-row{display:flex;justify-content:space-between;align-items:center;gap:8px;padding:8px 12px;border-bottom:1px solid #eee}
.file-name{overflow:hidden;text-overflow:ellipsis;white-space:nowrap;max-width:60%}
.small{font-size:.85rem;color:#666}
.btn{display:inline-block;padding:4px 10px;border:1px solid #0d6efd;border-radius:4px;color:#0d6efd;background:#fff;text-decoration:none;font-size:.85rem;cursor:pointer}
.btn-danger{border-color:#dc3545;color:#dc3545}
.upload{border:2px dashed #ced4da;border-radius:8px;padding:18px;text-align:center}
.footer{padding:10px;text-align:center;border-top:1px solid #eee}
</style>
</head><body>
)";

const char* const PAGE_TAIL = R"(</body></html>
)";

} // namespace

std::string html_escape(const std::string& text) {
  std::string out;
  out.reserve(text.size());
  for (char ch : text) {
    switch (ch) {
      case '&':  out += "&amp;";  break;
      case '<':  out += "&lt;";   break;
      case '>':  out += "&gt;";   break;
      case '"':  out += "&quot;"; break;
      case '\'': out += "&#39;";  break;
      default:   out.push_back(ch);
    }
  }
  return out;
}

std::string render_index(const IndexPage& page) {
  const std::string url = html_escape(page.url);
  std::ostringstream html;

  html << PAGE_HEAD
       << "<div class=\"card\">\n"
       << "<div class=\"header\">\n"
       << "  <div><h3 style=\"margin:0\">Share - Local File Share</h3>"
       << "<div class=\"small\">Share files between laptop and phone on the same Wi-Fi.</div></div>\n"
       << "  <div><div class=\"small\">Server URL</div><a href=\"" << url << "\">" << url << "</a></div>\n"
       << "  <form method=\"post\" action=\"/shutdown\" onsubmit=\"return confirm("
       << "'Are you sure you want to stop the server? This will close the connection for everyone.')\">"
       << "<button class=\"btn btn-danger\" type=\"submit\">Stop Server</button></form>\n"
       << "</div>\n";

  html << "<div class=\"section\">\n"
       << "  <form class=\"upload\" method=\"post\" action=\"/upload\" enctype=\"multipart/form-data\">\n"
       << "    <div class=\"small\" style=\"margin-bottom:8px\">Upload files</div>\n"
       << "    <input type=\"file\" name=\"file\" multiple>\n"
       << "    <button class=\"btn\" type=\"submit\">Upload</button>\n"
       << "  </form>\n"
       << "</div>\n";

  html << "<div class=\"section\">\n"
       << "  <div style=\"display:flex;justify-content:space-between\"><strong>Shared files</strong>"
       << "<span class=\"small\">/" << html_escape(page.folder_name) << "</span></div>\n";

  if (page.listing.names.empty()) {
    html << "  <div class=\"small\" style=\"margin-top:8px\">No files yet - upload something.</div>\n";
  }

  for (const auto& name : page.listing.names) {
    const std::string label = html_escape(name);
    const std::string encoded = url_encode(name);
    auto size = page.listing.sizes_by_name.find(name);

    html << "  <div class=\"file-row\">"
         << "<div class=\"file-name\"><a href=\"/files/" << encoded << "\">" << label << "</a></div>"
         << "<div class=\"small\">" << (size != page.listing.sizes_by_name.end() ? html_escape(size->second) : "")
         << "</div>"
         << "<div><a class=\"btn\" href=\"/files/" << encoded << "\" download>Down</a> "
         << "<a class=\"btn btn-danger\" href=\"/delete/" << encoded << "\" rel=\"nofollow\""
         << " onclick=\"return confirm('Delete ' + this.dataset.f + ' ?')\" data-f=\"" << label << "\">Del</a></div>"
         << "</div>\n";
  }

  html << "</div>\n"
       << "<div class=\"footer small\">Tip: Keep this page open on your laptop while opening the URL on your phone.</div>\n"
       << "</div>\n"
       << PAGE_TAIL;

  return html.str();
}

} // namespace web
} // namespace lanshare
