#pragma once

#include <filesystem>
#include <string>

namespace codejudge {

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @return 文本文件的内容(没有指定编码)
 * @throw internal_error 若文件无法打开
 */
std::string read_file_content(const std::filesystem::path &path);

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @param def 若文件不存在，返回 def
 * @return 文本文件的内容(没有指定编码)
 */
std::string read_file_content(const std::filesystem::path &path, const std::string &def);

/**
 * @brief 将 content 原样写入文件，若文件存在则覆盖
 * @throw internal_error 若文件无法写入
 */
void write_file_content(const std::filesystem::path &path, const std::string &content);

/**
 * @brief 作用域内独占的临时文件夹
 * 构造时在 root 下创建一个名字随机的文件夹，析构时删除该文件夹及其所有内容。
 * 因此无论编译、运行是正常结束、返回错误还是抛出异常，文件夹都会被清理。
 */
struct temporary_directory {
    /**
     * @param root 临时文件夹的父目录
     * @param prefix 文件夹名的前缀
     * @throw internal_error 若无法创建文件夹
     */
    explicit temporary_directory(const std::filesystem::path &root, const std::string &prefix = "codejudge-");
    ~temporary_directory();

    temporary_directory(const temporary_directory &) = delete;
    temporary_directory &operator=(const temporary_directory &) = delete;

    const std::filesystem::path &path() const;

private:
    std::filesystem::path dir;
};

}  // namespace codejudge
