#pragma once

#include <cstddef>
#include <fstream>
#include <optional>
#include <string>

namespace OpsTriage
{
    namespace Input
    {
        /**
         * FileReader
         *
         * Responsibilities:
         *  - Stream a JSON-lines record file one line at a time.
         *  - Track the current line number for error messages.
         *  - Manage the file handle via RAII.
         *
         * Design notes:
         *  - Single-threaded ownership; open one reader per file.
         *  - Not copyable (owns a file handle), but movable.
         */
        class FileReader
        {
        public:
            FileReader() = default;

            /// Open immediately; check isOpen() afterwards.
            explicit FileReader(const std::string &filePath);

            FileReader(const FileReader &)            = delete;
            FileReader &operator=(const FileReader &) = delete;

            FileReader(FileReader &&other) noexcept;
            FileReader &operator=(FileReader &&other) noexcept;

            ~FileReader();

            /// Any previously open file is closed first. Returns false on failure.
            bool open(const std::string &filePath);

            void close() noexcept;

            bool isOpen() const noexcept;

            const std::string &filePath() const noexcept { return m_filePath; }

            /// 1-based number of the line last returned by nextLine(); 0 before the first read.
            std::size_t lineNumber() const noexcept { return m_lineNumber; }

            /**
             * Next line without its terminator (a trailing '\r' is dropped).
             * std::nullopt on EOF, read error or when no file is open.
             */
            std::optional<std::string> nextLine();

        private:
            std::ifstream m_stream;
            std::string   m_filePath;
            std::size_t   m_lineNumber = 0;
        };

    } // namespace Input
} // namespace OpsTriage
