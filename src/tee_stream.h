// tee_stream.h - 双向输出流（同时输出到终端和文件）
//
// 主要用于捕获 CPLEX 求解器日志，使其同时显示在终端和写入日志文件。
// 多个工作线程各自持有独立的 CPLEX 环境, 但共享同一个 TeeStream,
// 因此所有写入都在锁内完成。
// 第二个目标流可以为空 (仅终端输出, 日志文件打开失败时使用)。

#ifndef TEE_STREAM_H_
#define TEE_STREAM_H_

#include <iostream>
#include <streambuf>
#include <mutex>
#include <algorithm>

// 线程安全的双向流缓冲区
class TeeStreambuf : public std::streambuf {
public:
    TeeStreambuf(std::streambuf* buf1, std::streambuf* buf2)
        : buf1_(buf1), buf2_(buf2) {}

    TeeStreambuf(const TeeStreambuf&) = delete;
    TeeStreambuf& operator=(const TeeStreambuf&) = delete;

protected:
    // 单字符写入
    virtual int overflow(int c) override {
        if (c == EOF) {
            return !EOF;
        }

        std::lock_guard<std::mutex> lock(mutex_);
        int r1 = buf1_->sputc(static_cast<char>(c));
        int r2 = buf2_ ? buf2_->sputc(static_cast<char>(c)) : c;
        return (r1 == EOF || r2 == EOF) ? EOF : c;
    }

    // 批量写入（CPLEX 主要使用这个方法输出日志）
    virtual std::streamsize xsputn(const char* s, std::streamsize n) override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::streamsize r1 = buf1_->sputn(s, n);
        std::streamsize r2 = buf2_ ? buf2_->sputn(s, n) : n;
        return (r1 < n || r2 < n) ? std::min(r1, r2) : n;
    }

    // 同步/刷新缓冲区
    virtual int sync() override {
        std::lock_guard<std::mutex> lock(mutex_);
        int r1 = buf1_->pubsync();
        int r2 = buf2_ ? buf2_->pubsync() : 0;
        return (r1 == 0 && r2 == 0) ? 0 : -1;
    }

private:
    std::streambuf* buf1_;  // 第一个目标（通常是 stdout）
    std::streambuf* buf2_;  // 第二个目标（日志文件, 可为空）
    mutable std::mutex mutex_;
};

// 双向输出流
// 用法: TeeStream tee(std::cout, &log_file); cplex.setOut(tee);
class TeeStream : public std::ostream {
public:
    TeeStream(std::ostream& os1, std::ostream* os2)
        : std::ostream(&tee_buf_)
        , tee_buf_(os1.rdbuf(), os2 ? os2->rdbuf() : nullptr) {}

    TeeStream(const TeeStream&) = delete;
    TeeStream& operator=(const TeeStream&) = delete;

private:
    TeeStreambuf tee_buf_;
};

#endif  // TEE_STREAM_H_
