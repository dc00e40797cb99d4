#pragma once
#ifndef COMMANDS_HPP
#define COMMANDS_HPP

#include <stdint.h>
#include <stddef.h>
#include <ostream>
#include <string>
#include <vector>

// Delay between characters printed by slowPrint
const unsigned int PRINT_DELAY_MS = 20;

/*Reads whole file, throws IoError*/
std::vector<uint8_t> readFile(const std::string& path);

/*Writes (truncates) whole file, throws IoError*/
void writeFile(const std::string& path, const std::vector<uint8_t>& bytes);

/*Hides message in a new chunk of type chunkType.
Result goes to outputPath, or back to inputPath when outputPath is empty*/
void hideMessage(const std::string& inputPath, const std::string& chunkType,
                 const std::string& message, const std::string& outputPath);

/*Returns data of every chunk of type chunkType, in file order*/
std::vector<std::string> findMessages(const std::string& path, const std::string& chunkType);

/*Removes every chunk of type chunkType and rewrites the file.
Returns number of removed chunks*/
size_t deleteMessages(const std::string& path, const std::string& chunkType);

/*Writes text one character at a time, flushing and sleeping delayMs after each*/
void slowPrint(std::ostream& os, const std::string& text, unsigned int delayMs = PRINT_DELAY_MS);

#endif
