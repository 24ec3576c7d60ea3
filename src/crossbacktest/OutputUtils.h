#pragma once

#include <streambuf>
#include <ostream>
#include <fstream>
#include <memory>
#include <string>

namespace crossbacktest
{
namespace utils
{

/**
 * @brief Stream buffer that mirrors output to two underlying buffers
 *
 * Used to write the run report to the console and a log file at the
 * same time.
 */
class TeeBuf : public std::streambuf
{
public:
    TeeBuf(std::streambuf* sb1, std::streambuf* sb2);

protected:
    /**
     * @brief Write one character to both buffers
     * @return EOF if either buffer fails, otherwise the character written
     */
    int overflow(int c) override;

    /**
     * @brief Synchronize both underlying buffers
     * @return 0 on success, -1 on error
     */
    int sync() override;

private:
    std::streambuf* mStreamBuf1;
    std::streambuf* mStreamBuf2;
};

/**
 * @brief Output stream that writes to two streams simultaneously
 */
class TeeStream : public std::ostream
{
public:
    TeeStream(std::ostream& streamA, std::ostream& streamB);

private:
    TeeBuf mTeeBuf;
};

/**
 * @brief Console output, optionally mirrored to a log file
 *
 * With an empty log file name stream() is std::cout. Otherwise the log
 * file is truncated and every line written to stream() also lands in it.
 *
 * @throws std::runtime_error if the log file cannot be opened
 */
class ReportOutput
{
public:
    explicit ReportOutput(const std::string& logFileName);

    ReportOutput(const ReportOutput&) = delete;
    ReportOutput& operator=(const ReportOutput&) = delete;

    std::ostream& stream();

    bool isLogging() const;

private:
    std::ofstream mLogFile;
    std::unique_ptr<TeeStream> mTee;
};

} // namespace utils
} // namespace crossbacktest
