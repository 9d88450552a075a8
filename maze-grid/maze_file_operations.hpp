#ifndef __MAZE_FILE_OPERATIONS_HPP___
#define __MAZE_FILE_OPERATIONS_HPP___

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

/**
 * @file maze_file_operations.hpp
 * @brief Simple helpers to read maze text and write solved-maze artifacts.
 *
 * Files are plain text, one maze row per line. Contents are passed through
 * unchanged; validation is the parser's job.
 */

/**
 * @brief Read a whole maze file into a string.
 *
 * @param filename Path to the input file.
 * @throws std::runtime_error if the file cannot be opened.
 * @return File contents.
 */
inline std::string read_maze_from_file(const std::string& filename) {
    std::ifstream infile(filename, std::ios::binary);
    if (!infile.is_open()) {
        throw std::runtime_error("Could not open file: " + filename);
    }
    std::ostringstream contents;
    contents << infile.rdbuf();
    return contents.str();
}

/**
 * @brief Write a rendered artifact to a file, replacing its contents.
 *
 * @param content Text to write.
 * @param filename Output file path.
 * @throws std::runtime_error if the file cannot be opened for writing.
 */
inline void write_output_to_file(const std::string& content, const std::string& filename) {
    std::ofstream outfile(filename, std::ios::binary | std::ios::trunc);
    if (!outfile.is_open()) {
        throw std::runtime_error("Could not open file for writing: " + filename);
    }
    outfile << content;
    if (!outfile) {
        throw std::runtime_error("Could not write to file: " + filename);
    }
}

#endif // __MAZE_FILE_OPERATIONS_HPP___
