#pragma once

#include <cstdint>
#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>


// PDFium public headers.
// Make sure they are in your include path.
#include "fpdfview.h"
#include "fpdf_edit.h"
#include "fpdf_save.h"

namespace pdfium {
    // ============================================================
    //  PdfiumLibrary (process-wide RAII + global mutex)
    // ============================================================
    class PdfiumLibrary {
    public:
        PdfiumLibrary(const PdfiumLibrary &) = delete;

        PdfiumLibrary &operator=(const PdfiumLibrary &) = delete;

        static PdfiumLibrary &Instance() {
            static PdfiumLibrary instance;
            return instance;
        }

        std::mutex &Mutex() noexcept { return mutex_; }

    private:
        PdfiumLibrary() {
            FPDF_InitLibrary();
        }

        ~PdfiumLibrary() {
            FPDF_DestroyLibrary();
        }

        std::mutex mutex_;
    };

    // ============================================================
    //  RAII wrappers: Document & Page
    // ============================================================
    class Document {
    public:
        Document() = default;

        // Loads from memory. The bytes are owned by the Document because
        // PDFium reads from them lazily for the lifetime of the handle.
        explicit Document(std::vector<std::uint8_t> bytes,
                          const std::string &password = {}) {
            Load(std::move(bytes), password);
        }

        ~Document() {
            Reset();
        }

        Document(const Document &) = delete;

        Document &operator=(const Document &) = delete;

        Document(Document &&other) noexcept
            : handle_(other.handle_)
              , bytes_(std::move(other.bytes_)) {
            other.handle_ = nullptr;
        }

        Document &operator=(Document &&other) noexcept {
            if (this != &other) {
                Reset();
                handle_ = other.handle_;
                bytes_ = std::move(other.bytes_);
                other.handle_ = nullptr;
            }
            return *this;
        }

        static Document CreateNew() {
            Document doc;

            auto &lib = PdfiumLibrary::Instance();
            std::lock_guard lock(lib.Mutex());

            doc.handle_ = FPDF_CreateNewDocument();
            if (!doc.handle_)
                throw std::runtime_error("FPDF_CreateNewDocument failed");
            return doc;
        }

        void Load(std::vector<std::uint8_t> bytes,
                  const std::string &password = {}) {
            Reset();
            bytes_ = std::move(bytes);

            auto &lib = PdfiumLibrary::Instance();
            std::lock_guard lock(lib.Mutex());

            handle_ = FPDF_LoadMemDocument64(
                bytes_.data(),
                bytes_.size(),
                password.empty() ? nullptr : password.c_str());

            if (!handle_) {
                const unsigned long err = FPDF_GetLastError();
                bytes_.clear();
                throw std::runtime_error("FPDF_LoadMemDocument64 failed, error = " +
                                         std::to_string(err));
            }
        }

        void Reset() noexcept {
            if (handle_) {
                auto &lib = PdfiumLibrary::Instance();
                std::lock_guard<std::mutex> lock(lib.Mutex());
                FPDF_CloseDocument(handle_);
                handle_ = nullptr;
            }
            bytes_.clear();
        }

        [[nodiscard]] bool IsValid() const noexcept { return handle_ != nullptr; }

        [[nodiscard]] FPDF_DOCUMENT Get() const noexcept { return handle_; }

        [[nodiscard]] int GetPageCount() const {
            if (!handle_)
                return 0;
            auto &lib = PdfiumLibrary::Instance();
            std::lock_guard<std::mutex> lock(lib.Mutex());
            return FPDF_GetPageCount(handle_);
        }

        // Serializes the whole document (full rewrite, not incremental).
        [[nodiscard]] std::vector<std::uint8_t> SaveToBytes() const {
            if (!handle_)
                throw std::runtime_error("Document::SaveToBytes: null document handle");

            struct MemoryWriter : FPDF_FILEWRITE {
                std::vector<std::uint8_t> out;
            };

            MemoryWriter writer;
            writer.version = 1;
            writer.WriteBlock = [](FPDF_FILEWRITE *self, const void *data, const unsigned long size) -> int {
                auto *w = static_cast<MemoryWriter *>(self);
                const auto *p = static_cast<const std::uint8_t *>(data);
                w->out.insert(w->out.end(), p, p + size);
                return 1;
            };

            auto &lib = PdfiumLibrary::Instance();
            std::lock_guard lock(lib.Mutex());

            if (!FPDF_SaveAsCopy(handle_, &writer, FPDF_NO_INCREMENTAL))
                throw std::runtime_error("FPDF_SaveAsCopy failed");

            return std::move(writer.out);
        }

    private:
        FPDF_DOCUMENT handle_ = nullptr;
        std::vector<std::uint8_t> bytes_;
    };

    class Page {
    public:
        Page() = default;

        Page(FPDF_DOCUMENT doc, const int index) {
            Open(doc, index);
        }

        ~Page() {
            Reset();
        }

        Page(const Page &) = delete;

        Page &operator=(const Page &) = delete;

        Page(Page &&other) noexcept
            : handle_(other.handle_) {
            other.handle_ = nullptr;
        }

        Page &operator=(Page &&other) noexcept {
            if (this != &other) {
                Reset();
                handle_ = other.handle_;
                other.handle_ = nullptr;
            }
            return *this;
        }

        // Appends a blank page of the given size (points) to doc.
        static Page CreateNew(FPDF_DOCUMENT doc, const int index,
                              const double width, const double height) {
            if (!doc)
                throw std::runtime_error("Page::CreateNew: null document handle");

            Page page;

            auto &lib = PdfiumLibrary::Instance();
            std::lock_guard lock(lib.Mutex());

            page.handle_ = FPDFPage_New(doc, index, width, height);
            if (!page.handle_)
                throw std::runtime_error("FPDFPage_New failed at index " +
                                         std::to_string(index));
            return page;
        }

        void Open(FPDF_DOCUMENT doc, const int index) {
            Reset();
            if (!doc)
                throw std::runtime_error("Page::Open: null document handle");

            auto &lib = PdfiumLibrary::Instance();
            std::lock_guard lock(lib.Mutex());

            handle_ = FPDF_LoadPage(doc, index);
            if (!handle_)
                throw std::runtime_error("FPDF_LoadPage failed at index " +
                                         std::to_string(index));
        }

        void Reset() noexcept {
            if (handle_) {
                auto &lib = PdfiumLibrary::Instance();
                std::lock_guard<std::mutex> lock(lib.Mutex());
                FPDF_ClosePage(handle_);
                handle_ = nullptr;
            }
        }

        // Writes inserted page objects into the page content stream.
        void GenerateContent() const {
            if (!handle_)
                return;
            auto &lib = PdfiumLibrary::Instance();
            std::lock_guard lock(lib.Mutex());
            if (!FPDFPage_GenerateContent(handle_))
                throw std::runtime_error("FPDFPage_GenerateContent failed");
        }

        [[nodiscard]] bool IsValid() const noexcept { return handle_ != nullptr; }

        [[nodiscard]] FPDF_PAGE Get() const noexcept { return handle_; }

        [[nodiscard]] double Width() const {
            if (!handle_) return 0.0;
            auto &lib = PdfiumLibrary::Instance();
            std::lock_guard<std::mutex> lock(lib.Mutex());
            return FPDF_GetPageWidth(handle_);
        }

        [[nodiscard]] double Height() const {
            if (!handle_) return 0.0;
            auto &lib = PdfiumLibrary::Instance();
            std::lock_guard<std::mutex> lock(lib.Mutex());
            return FPDF_GetPageHeight(handle_);
        }

    private:
        FPDF_PAGE handle_ = nullptr;
    };
} // namespace pdfium
