#include "OutputUtils.h"
#include <iostream>
#include <stdexcept>

namespace crossbacktest
{
namespace utils
{

TeeBuf::TeeBuf(std::streambuf* sb1, std::streambuf* sb2)
    : mStreamBuf1(sb1),
      mStreamBuf2(sb2)
{
}

int TeeBuf::overflow(int c)
{
    if (c == EOF)
    {
        return !EOF;
    }

    const int r1 = mStreamBuf1->sputc(static_cast<char>(c));
    const int r2 = mStreamBuf2->sputc(static_cast<char>(c));
    return (r1 == EOF || r2 == EOF) ? EOF : c;
}

int TeeBuf::sync()
{
    const int r1 = mStreamBuf1->pubsync();
    const int r2 = mStreamBuf2->pubsync();
    return (r1 == 0 && r2 == 0) ? 0 : -1;
}

TeeStream::TeeStream(std::ostream& streamA, std::ostream& streamB)
    : std::ostream(nullptr),
      mTeeBuf(streamA.rdbuf(), streamB.rdbuf())
{
    this->rdbuf(&mTeeBuf);
}

ReportOutput::ReportOutput(const std::string& logFileName)
    : mLogFile(),
      mTee()
{
    if (logFileName.empty())
    {
        return;
    }

    mLogFile.open(logFileName, std::ios::out | std::ios::trunc);
    if (!mLogFile.is_open())
    {
        throw std::runtime_error("Cannot open log file for writing: " + logFileName);
    }

    mTee = std::make_unique<TeeStream>(std::cout, mLogFile);
}

std::ostream& ReportOutput::stream()
{
    if (mTee)
    {
        return *mTee;
    }

    return std::cout;
}

bool ReportOutput::isLogging() const
{
    return static_cast<bool>(mTee);
}

} // namespace utils
} // namespace crossbacktest
