// logger.cpp - 日志系统实现
//
// Logger 类的主要实现在 logger.h 中（内联）
// 这里只定义全局日志器指针; 它由 main 中的 Logger 实例设置,
// 是跨分区共享的唯一输出通道

#include "logger.h"

Logger* g_logger = nullptr;
