#pragma once

#include <fstream>
#include <optional>
#include <string>

namespace HiveVerify
{
    namespace Input
    {
        /**
         * FileReader
         *
         * Responsibilities:
         *  - Own the input stream of a captured log file (RAII).
         *  - Hand the parser either one line at a time or the whole buffer.
         *
         * Not copyable (owns a file handle), but movable.
         */
        class FileReader
        {
        public:
            FileReader() = default;

            /// Open immediately; check isOpen() for the outcome.
            explicit FileReader(const std::string &filePath);

            FileReader(const FileReader &)            = delete;
            FileReader &operator=(const FileReader &) = delete;

            FileReader(FileReader &&other) noexcept;
            FileReader &operator=(FileReader &&other) noexcept;

            ~FileReader();

            /// Open filePath, closing any previous file. Returns false on failure.
            bool open(const std::string &filePath);

            void close() noexcept;

            bool isOpen() const noexcept;

            const std::string &filePath() const noexcept;

            /**
             * Next line without its '\n' (and without a trailing '\r').
             * std::nullopt at EOF or on a read error.
             */
            std::optional<std::string> nextLine();

            /**
             * Everything from the current position to EOF, lines joined with '\n'.
             * std::nullopt if no file is open or the stream fails before EOF.
             */
            std::optional<std::string> readAll();

        private:
            std::ifstream m_stream;
            std::string   m_filePath;
        };

        /// Convenience: open filePath and return its whole content.
        std::optional<std::string> readFile(const std::string &filePath);

    } // namespace Input
} // namespace HiveVerify
