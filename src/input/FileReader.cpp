#include "input/FileReader.hpp"

#include <utility>

namespace HiveVerify
{
    namespace Input
    {
        FileReader::FileReader(const std::string &filePath)
        {
            open(filePath);
        }

        FileReader::FileReader(FileReader &&other) noexcept
            : m_stream(std::move(other.m_stream)),
              m_filePath(std::move(other.m_filePath))
        {
        }

        FileReader &FileReader::operator=(FileReader &&other) noexcept
        {
            if (this != &other)
            {
                close();
                m_stream   = std::move(other.m_stream);
                m_filePath = std::move(other.m_filePath);
            }
            return *this;
        }

        FileReader::~FileReader()
        {
            close();
        }

        bool FileReader::open(const std::string &filePath)
        {
            close();

            // Binary mode: line endings are normalized in nextLine(), not by the runtime.
            m_stream.open(filePath, std::ios::in | std::ios::binary);
            if (!m_stream.is_open())
            {
                return false;
            }

            m_filePath = filePath;
            return true;
        }

        void FileReader::close() noexcept
        {
            if (m_stream.is_open())
            {
                m_stream.close();
            }
            m_stream.clear();
            m_filePath.clear();
        }

        bool FileReader::isOpen() const noexcept
        {
            return m_stream.is_open();
        }

        const std::string &FileReader::filePath() const noexcept
        {
            return m_filePath;
        }

        std::optional<std::string> FileReader::nextLine()
        {
            if (!m_stream.is_open())
            {
                return std::nullopt;
            }

            std::string line;
            if (!std::getline(m_stream, line))
            {
                return std::nullopt;
            }

            if (!line.empty() && line.back() == '\r')
            {
                line.pop_back();
            }

            return line;
        }

        std::optional<std::string> FileReader::readAll()
        {
            if (!m_stream.is_open())
            {
                return std::nullopt;
            }

            std::string content;
            bool first = true;
            while (auto line = nextLine())
            {
                if (!first)
                {
                    content.push_back('\n');
                }
                content.append(*line);
                first = false;
            }

            if (m_stream.bad())
            {
                return std::nullopt;
            }
            return content;
        }

        std::optional<std::string> readFile(const std::string &filePath)
        {
            FileReader reader(filePath);
            if (!reader.isOpen())
            {
                return std::nullopt;
            }
            return reader.readAll();
        }

    } // namespace Input
} // namespace HiveVerify
