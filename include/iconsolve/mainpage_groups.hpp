/**
 * @mainpage iconsolve
 *
 * IconCaptcha 挑战图求解器：批量读取目录中的图像，编码为 base64，
 * 交给可注入的 Solver，逐行打印结果。
 *
 * @defgroup Core 核心 (Core)
 * @brief 图像缓冲、Icon 结果、Logger
 *
 * @defgroup IO 输入输出 (IO)
 * @brief Reader、目录枚举、PNG 编解码
 *
 * @defgroup Algo 算法/管线 (Algo)
 * @brief IconCaptcha 求解、Solver 接口、批处理 Pipeline
 *
 * @defgroup Util 实用工具 (Util)
 * @brief ScopeGuard、Result、Base64 等通用组件
 *
 * @defgroup App 应用 (App)
 * @brief 命令行参数与配置
 */
