#pragma once
#include <cstddef>
#include <ostream>
#include <string>

#include "iconsolve/algo/solver.hpp"
#include "iconsolve/io/reader.hpp"
#include "iconsolve/util/result.hpp"

/**
 * @file
 * @brief 目录批处理管线
 * @ingroup Algo
 */

namespace iconsolve::algo {
using iconsolve::io::Reader;
using iconsolve::util::Result;

/// @brief 结果行的格式
enum class OutputFormat {
    Object,  ///< `{ position: 3, ..., success: true }`
    Xy,      ///< `x: 50, y: 25`
};

/// @brief 一次批处理的计数
struct Summary {
    std::size_t entries = 0;   ///< 目录条目数
    std::size_t solved = 0;    ///< 求解成功
    std::size_t rejected = 0;  ///< 求解器返回错误（无效图像等）
    std::size_t failed = 0;    ///< 读取失败或求解器抛出异常
};

/// 把单个求解结果格式化成一行（不含换行符）
std::string format_outcome(const Result<Icon>& outcome, OutputFormat fmt);

/**
 * @brief 顺序处理目录中的每个文件
 *
 * 每个条目恰好产生一行：结果写到 out，错误经由 Logger::error。
 * 单个条目失败不会中断后续条目。
 */
class Pipeline {
   public:
    Pipeline(Reader& reader, Solver& solver, std::ostream& out,
             OutputFormat fmt = OutputFormat::Object)
        : reader_(reader), solver_(solver), out_(out), fmt_(fmt) {}

    /**
     * @brief 列目录、读取、编码、求解、输出
     *
     * @dot
     * digraph seq {
     *   rankdir=LR;
     *   node [shape=plaintext];
     *   run[label="Pipeline::run(dir)"];
     *   list[label="list_directory()"];
     *   reader[label="Reader::read_all()"];
     *   enc[label="base64::encode()"];
     *   solver[label="Solver::solve()"];
     *   logger[label="Logger::error()"];
     *   run -> list;
     *   run -> reader -> enc -> solver;
     *   run -> logger [label="per-file failure"];
     * }
     * @enddot
     *
     * 目录本身无法列出时返回错误。
     */
    Result<Summary> run(const std::string& dir);

   private:
    Reader& reader_;
    Solver& solver_;
    std::ostream& out_;
    OutputFormat fmt_;
};

}  // namespace iconsolve::algo
