#include "package/epub_writer.hpp"
#include "package/zip_writer.hpp"
#include "util/text.hpp"

#include <cstdio>
#include <sstream>
#include <pugixml.hpp>

namespace panelpress {

namespace {

const char MIMETYPE[] = "application/epub+zip";

std::string serialize(const pugi::xml_document& doc) {
    std::ostringstream oss;
    doc.save(oss, "  ", pugi::format_default, pugi::encoding_utf8);
    return oss.str();
}

void add_declaration(pugi::xml_document& doc) {
    pugi::xml_node decl = doc.append_child(pugi::node_declaration);
    decl.append_attribute("version") = "1.0";
    decl.append_attribute("encoding") = "utf-8";
}

pugi::xml_node add_meta(pugi::xml_node metadata, const char* name, const std::string& content) {
    pugi::xml_node meta = metadata.append_child("meta");
    meta.append_attribute("name") = name;
    meta.append_attribute("content") = content.c_str();
    return meta;
}

pugi::xml_node add_property(pugi::xml_node metadata, const char* property, const std::string& value) {
    pugi::xml_node meta = metadata.append_child("meta");
    meta.append_attribute("property") = property;
    meta.text() = value.c_str();
    return meta;
}

pugi::xml_node add_item(pugi::xml_node manifest, const std::string& id, const std::string& href,
                        const char* media_type) {
    pugi::xml_node item = manifest.append_child("item");
    item.append_attribute("id") = id.c_str();
    item.append_attribute("href") = href.c_str();
    item.append_attribute("media-type") = media_type;
    return item;
}

pugi::xml_node xhtml_root(pugi::xml_document& doc, const std::string& title) {
    add_declaration(doc);
    doc.append_child(pugi::node_doctype).set_value("html");
    pugi::xml_node html = doc.append_child("html");
    html.append_attribute("xmlns") = "http://www.w3.org/1999/xhtml";
    html.append_attribute("xmlns:epub") = "http://www.idpf.org/2007/ops";
    pugi::xml_node head = html.append_child("head");
    head.append_child("title").text() = title.c_str();
    return html;
}

std::string resolved_title(const BookMetadata& meta, const VolumeLabel& label) {
    if (!label.title.empty()) return label.title;
    if (!meta.title.empty()) return meta.title;
    return "Untitled";
}

}

EpubWriter::EpubWriter(const Config& config) : config_(config) {}

std::string EpubWriter::page_name(int number) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "page_%04d.xhtml", number);
    return buf;
}

std::string EpubWriter::image_name(int number) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "images/page_%04d.jpg", number);
    return buf;
}

std::string EpubWriter::container_xml() const {
    pugi::xml_document doc;
    add_declaration(doc);
    pugi::xml_node container = doc.append_child("container");
    container.append_attribute("version") = "1.0";
    container.append_attribute("xmlns") = "urn:oasis:names:tc:opendocument:xmlns:container";
    pugi::xml_node rootfile = container.append_child("rootfiles").append_child("rootfile");
    rootfile.append_attribute("full-path") = "OEBPS/content.opf";
    rootfile.append_attribute("media-type") = "application/oebps-package+xml";
    return serialize(doc);
}

std::string EpubWriter::stylesheet() const {
    return "@page {\n"
           "  margin: 0;\n"
           "}\n"
           "html, body {\n"
           "  margin: 0;\n"
           "  padding: 0;\n"
           "  width: 100%;\n"
           "  height: 100%;\n"
           "  background-color: #000000;\n"
           "}\n"
           "div.page {\n"
           "  width: 100%;\n"
           "  height: 100%;\n"
           "  display: flex;\n"
           "  align-items: center;\n"
           "  justify-content: center;\n"
           "  text-align: center;\n"
           "}\n"
           "div.page img {\n"
           "  max-width: 100%;\n"
           "  max-height: 100%;\n"
           "}\n";
}

std::string EpubWriter::page_xhtml(const std::string& label, const std::string& image, Size image_size) const {
    pugi::xml_document doc;
    pugi::xml_node html = xhtml_root(doc, label);
    pugi::xml_node head = html.child("head");

    std::string viewport = "width=" + std::to_string(config_.width) + ", height=" + std::to_string(config_.height);
    pugi::xml_node meta = head.append_child("meta");
    meta.append_attribute("name") = "viewport";
    meta.append_attribute("content") = viewport.c_str();

    pugi::xml_node link = head.append_child("link");
    link.append_attribute("rel") = "stylesheet";
    link.append_attribute("type") = "text/css";
    link.append_attribute("href") = "style/main.css";

    pugi::xml_node div = html.append_child("body").append_child("div");
    div.append_attribute("class") = "page";
    pugi::xml_node img = div.append_child("img");
    img.append_attribute("src") = image.c_str();
    img.append_attribute("alt") = label.c_str();
    img.append_attribute("width") = image_size.width;
    img.append_attribute("height") = image_size.height;
    return serialize(doc);
}

std::string EpubWriter::package_opf(const OutputVolume& volume, const BookMetadata& meta,
                                    const VolumeLabel& label, const std::string& uid) const {
    const bool rtl = config_.direction == ReadingDirection::RightToLeft;
    const bool custom_cover = !meta.cover.empty();
    const std::string title = resolved_title(meta, label);

    pugi::xml_document doc;
    add_declaration(doc);
    pugi::xml_node package = doc.append_child("package");
    package.append_attribute("xmlns") = "http://www.idpf.org/2007/opf";
    package.append_attribute("version") = "3.0";
    package.append_attribute("unique-identifier") = "bookid";
    package.append_attribute("prefix") = "rendition: http://www.idpf.org/vocab/rendition/#";

    pugi::xml_node metadata = package.append_child("metadata");
    metadata.append_attribute("xmlns:dc") = "http://purl.org/dc/elements/1.1/";
    metadata.append_attribute("xmlns:opf") = "http://www.idpf.org/2007/opf";

    pugi::xml_node identifier = metadata.append_child("dc:identifier");
    identifier.append_attribute("id") = "bookid";
    identifier.text() = ("urn:uuid:" + uid).c_str();
    metadata.append_child("dc:title").text() = title.c_str();
    metadata.append_child("dc:language").text() = meta.language.empty() ? "en" : meta.language.c_str();
    if (!meta.author.empty()) {
        metadata.append_child("dc:creator").text() = meta.author.c_str();
    }
    if (!meta.description.empty()) {
        metadata.append_child("dc:description").text() = meta.description.c_str();
    }
    add_property(metadata, "dcterms:modified", iso8601_utc(now_unix_ms()));

    if (!meta.series.empty()) {
        add_meta(metadata, "calibre:series", meta.series);
        add_meta(metadata, "calibre:series_index", label.series_index);
    }

    add_meta(metadata, "cover", custom_cover ? "cover-image" : "img_0001");
    add_meta(metadata, "fixed-layout", "true");
    add_meta(metadata, "original-resolution",
             std::to_string(config_.width) + "x" + std::to_string(config_.height));
    add_meta(metadata, "book-type", "comic");
    add_meta(metadata, "zero-gutter", "true");
    add_meta(metadata, "zero-margin", "true");
    add_meta(metadata, "orientation-lock", "portrait");
    add_meta(metadata, "region-mag", "true");
    if (rtl) add_meta(metadata, "primary-writing-mode", "horizontal-rl");
    add_property(metadata, "rendition:layout", "pre-paginated");
    add_property(metadata, "rendition:spread", "landscape");
    add_property(metadata, "rendition:orientation", "portrait");

    pugi::xml_node manifest = package.append_child("manifest");
    add_item(manifest, "ncx", "toc.ncx", "application/x-dtbncx+xml");
    add_item(manifest, "nav", "nav.xhtml", "application/xhtml+xml").append_attribute("properties") = "nav";
    add_item(manifest, "css", "style/main.css", "text/css");
    if (custom_cover) {
        add_item(manifest, "cover-image", "images/cover.jpg", "image/jpeg")
            .append_attribute("properties") = "cover-image";
        add_item(manifest, "cover", "cover.xhtml", "application/xhtml+xml");
    }
    for (size_t i = 0; i < volume.pages.size(); ++i) {
        int n = static_cast<int>(i) + 1;
        char id[32];
        std::snprintf(id, sizeof(id), "img_%04d", n);
        pugi::xml_node img = add_item(manifest, id, image_name(n), "image/jpeg");
        if (!custom_cover && n == 1) {
            img.append_attribute("properties") = "cover-image";
        }
        std::snprintf(id, sizeof(id), "page_%04d", n);
        add_item(manifest, id, page_name(n), "application/xhtml+xml");
    }

    pugi::xml_node spine = package.append_child("spine");
    spine.append_attribute("toc") = "ncx";
    spine.append_attribute("page-progression-direction") = rtl ? "rtl" : "ltr";
    if (custom_cover) {
        pugi::xml_node ref = spine.append_child("itemref");
        ref.append_attribute("idref") = "cover";
        ref.append_attribute("linear") = "yes";
    }
    for (size_t i = 0; i < volume.pages.size(); ++i) {
        char id[32];
        std::snprintf(id, sizeof(id), "page_%04d", static_cast<int>(i) + 1);
        pugi::xml_node ref = spine.append_child("itemref");
        ref.append_attribute("idref") = id;
    }
    return serialize(doc);
}

std::string EpubWriter::toc_ncx(const OutputVolume& volume, const std::string& title,
                                const std::string& uid) const {
    pugi::xml_document doc;
    add_declaration(doc);
    pugi::xml_node ncx = doc.append_child("ncx");
    ncx.append_attribute("xmlns") = "http://www.daisy.org/z3986/2005/ncx/";
    ncx.append_attribute("version") = "2005-1";

    pugi::xml_node head = ncx.append_child("head");
    auto head_meta = [&head](const char* name, const std::string& content) {
        pugi::xml_node m = head.append_child("meta");
        m.append_attribute("name") = name;
        m.append_attribute("content") = content.c_str();
    };
    head_meta("dtb:uid", "urn:uuid:" + uid);
    head_meta("dtb:depth", "1");
    head_meta("dtb:totalPageCount", "0");
    head_meta("dtb:maxPageNumber", "0");

    ncx.append_child("docTitle").append_child("text").text() = title.c_str();

    pugi::xml_node nav_map = ncx.append_child("navMap");
    for (size_t i = 0; i < volume.pages.size(); ++i) {
        int n = static_cast<int>(i) + 1;
        pugi::xml_node point = nav_map.append_child("navPoint");
        point.append_attribute("id") = ("nav" + std::to_string(n)).c_str();
        point.append_attribute("playOrder") = n;
        point.append_child("navLabel").append_child("text").text() = ("Page " + std::to_string(n)).c_str();
        point.append_child("content").append_attribute("src") = page_name(n).c_str();
    }
    return serialize(doc);
}

std::string EpubWriter::nav_xhtml(const OutputVolume& volume, const std::string& title) const {
    pugi::xml_document doc;
    pugi::xml_node html = xhtml_root(doc, title);
    pugi::xml_node nav = html.append_child("body").append_child("nav");
    nav.append_attribute("epub:type") = "toc";
    nav.append_attribute("id") = "toc";
    nav.append_child("h1").text() = title.c_str();
    pugi::xml_node ol = nav.append_child("ol");
    for (size_t i = 0; i < volume.pages.size(); ++i) {
        int n = static_cast<int>(i) + 1;
        pugi::xml_node a = ol.append_child("li").append_child("a");
        a.append_attribute("href") = page_name(n).c_str();
        a.text() = ("Page " + std::to_string(n)).c_str();
    }
    return serialize(doc);
}

Result EpubWriter::write(const std::string& path, const OutputVolume& volume, const BookMetadata& meta,
                         const VolumeLabel& label) const {
    if (volume.pages.empty()) {
        return Result::fail(ErrorCode::INVALID_ARGUMENT, "volume " + std::to_string(volume.index) + " has no pages");
    }
    const std::string uid = make_uuid();
    const std::string title = resolved_title(meta, label);

    ZipWriter zip;
    Result r = zip.open(path);
    if (r.failure()) return r;

    // mimetype must be the first entry and stored.
    r = zip.add_text("mimetype", MIMETYPE, false);
    if (r.success()) r = zip.add_text("META-INF/container.xml", container_xml());
    if (r.success()) r = zip.add_text("OEBPS/content.opf", package_opf(volume, meta, label, uid));
    if (r.success()) r = zip.add_text("OEBPS/toc.ncx", toc_ncx(volume, title, uid));
    if (r.success()) r = zip.add_text("OEBPS/nav.xhtml", nav_xhtml(volume, title));
    if (r.success()) r = zip.add_text("OEBPS/style/main.css", stylesheet());

    if (r.success() && !meta.cover.empty()) {
        Size cover_size = meta.cover_size.empty() ? Size{config_.width, config_.height} : meta.cover_size;
        r = zip.add_buffer("OEBPS/images/cover.jpg", meta.cover);
        if (r.success()) r = zip.add_text("OEBPS/cover.xhtml", page_xhtml("Cover", "images/cover.jpg", cover_size));
    }

    for (size_t i = 0; i < volume.pages.size() && r.success(); ++i) {
        int n = static_cast<int>(i) + 1;
        const Page& page = volume.pages[i];
        r = zip.add_buffer("OEBPS/" + image_name(n), page.data);
        if (r.success()) r = zip.add_text("OEBPS/" + page_name(n), page_xhtml("Page " + std::to_string(n), image_name(n), page.size));
    }

    if (r.failure()) {
        zip.discard();
        return r;
    }
    return zip.commit();
}

}
