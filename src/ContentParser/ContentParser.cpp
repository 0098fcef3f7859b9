#include "ContentParser.hpp"
#include "Logger.hpp"

#include <memory>
#include <poppler/cpp/poppler-document.h>
#include <poppler/cpp/poppler-page.h>
#include <fstream>
#include <iostream>
#include <iterator>

static const char* kComp = "ContentParser";

// Desc: extract text from in-memory PDF data
// In: const std::string& data, std::string& out, std::string& error
// Out: bool (false if the document cannot be loaded or has no text)
static bool extract_text_from_pdf_data(const std::string& data,
                                       std::string& out,
                                       std::string& error) {
    try {
        poppler::byte_array ba;
        ba.assign(data.begin(), data.end());

        std::unique_ptr<poppler::document> doc(
            poppler::document::load_from_data(&ba)
        );
        if (!doc) {
            error = "poppler: load_from_data failed";
            return false;
        }
        if (doc->is_locked()) {
            error = "poppler: document is encrypted";
            return false;
        }

        std::string text;
        const int pages = doc->pages();
        for (int i = 0; i < pages; ++i) {
            std::unique_ptr<poppler::page> page(doc->create_page(i));
            if (!page) continue;

            auto u = page->text().to_utf8();     // poppler::byte_array = std::vector<char>
            if (!u.empty()) {
                text.append(u.begin(), u.end());
                text.push_back('\n');
            }
        }
        if (text.empty()) {
            error = "poppler: empty extraction result";
            return false;
        }
        out = std::move(text);
        return true;
    } catch (const std::exception& e) {
        error = std::string("poppler: ") + e.what();
        return false;
    }
}

// Desc: detect content type from raw bytes ("%PDF-" => "pdf")
// In: const std::string& raw_content
// Out: std::string ("pdf" or "text")
std::string ContentParser::detect_type(const std::string& raw_content) {
    if (raw_content.rfind("%PDF-", 0) == 0) return "pdf";
    return "text";
}

bool ContentParser::extract_text(const std::string& type,
                                 const std::string& raw_content,
                                 std::string& out,
                                 std::string& error) {
    if (type == "pdf") {
        return extract_text_from_pdf_data(raw_content, out, error);
    }
    out = raw_content;
    return true;
}

bool ContentParser::load_file(const std::string& path, LoadedInput& out, std::string& error) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        error = "cannot open file: " + path;
        return false;
    }
    std::string raw((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        error = "read failed: " + path;
        return false;
    }

    LoadedInput li;
    li.source = path;
    li.type = detect_type(raw);
    if (!extract_text(li.type, raw, li.text, error)) {
        error = path + ": " + error;
        return false;
    }
    Logger::debug(kComp, "loaded " + path + " (" + li.type + ", " + std::to_string(li.text.size()) + " bytes)");
    out = std::move(li);
    return true;
}

bool ContentParser::load_stream(std::istream& in, LoadedInput& out, std::string& error) {
    std::string raw((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        error = "read failed: <stdin>";
        return false;
    }
    out.text = std::move(raw);
    out.type = "text";
    out.source = "<stdin>";
    return true;
}

// Desc: acquire the input text from exactly one source
// In: const InputRequest& req, LoadedInput& out, std::string& error
// Out: bool (false on zero/multiple sources or I/O failure)
bool ContentParser::load_input(const InputRequest& req, LoadedInput& out, std::string& error) {
    const int sources = (req.text ? 1 : 0) + (req.file.empty() ? 0 : 1) + (req.use_stdin ? 1 : 0);
    if (sources == 0) {
        error = "no input provided (use --text, --file or --stdin)";
        return false;
    }
    if (sources > 1) {
        error = "provide only one of --text, --file or --stdin";
        return false;
    }

    if (req.text) {
        out.text = *req.text;
        out.type = "text";
        out.source = "<text>";
        return true;
    }
    if (!req.file.empty()) {
        return load_file(req.file, out, error);
    }
    return load_stream(std::cin, out, error);
}
