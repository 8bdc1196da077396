#include "gardener/discovery/file_types.hpp"

#include "gardener/common/fs.hpp"

#include <array>
#include <fstream>
#include <unordered_map>
#include <unordered_set>

namespace gardener::discovery {

namespace {

constexpr std::uintmax_t kSniffLimitBytes = 1024 * 1024;
constexpr std::size_t kSniffSampleBytes = 1024;

const std::unordered_set<std::string> &source_extensions() {
  static const std::unordered_set<std::string> extensions = {
      ".py",   ".js",   ".ts",   ".jsx",  ".tsx", ".java", ".c",    ".cpp", ".cc",   ".cxx",
      ".h",    ".hpp",  ".hh",   ".cs",   ".php", ".rb",   ".go",   ".rs",  ".swift", ".kt",
      ".scala", ".clj", ".hs",   ".ml",   ".fs",  ".vb",   ".pl",   ".sh",  ".bash", ".zsh",
      ".fish", ".ps1",  ".bat",  ".cmd",  ".r",   ".m",    ".mm",   ".sql", ".html", ".htm",
      ".css",  ".scss", ".sass", ".less", ".xml", ".json", ".yaml", ".yml", ".toml", ".ini",
      ".cfg",  ".conf", ".md",   ".rst",  ".tex", ".vue",  ".cmake"};
  return extensions;
}

const std::unordered_map<std::string, FileType> &typed_extensions() {
  static const std::unordered_map<std::string, FileType> extensions = {
      {".txt", FileType::Text},      {".csv", FileType::Text},      {".tsv", FileType::Text},
      {".rtf", FileType::Document},  {".pdf", FileType::Document},  {".doc", FileType::Document},
      {".docx", FileType::Document}, {".odt", FileType::Document},  {".png", FileType::Image},
      {".jpg", FileType::Image},     {".jpeg", FileType::Image},    {".gif", FileType::Image},
      {".bmp", FileType::Image},     {".svg", FileType::Image},     {".ico", FileType::Image},
      {".webp", FileType::Image},    {".tiff", FileType::Image},    {".zip", FileType::Archive},
      {".tar", FileType::Archive},   {".gz", FileType::Archive},    {".tgz", FileType::Archive},
      {".bz2", FileType::Archive},   {".xz", FileType::Archive},    {".rar", FileType::Archive},
      {".7z", FileType::Archive},    {".jar", FileType::Archive},   {".bin", FileType::Binary},
      {".a", FileType::Binary},      {".lib", FileType::Binary},    {".dylib", FileType::Binary},
      {".wasm", FileType::Binary},   {".db", FileType::Binary},     {".sqlite", FileType::Binary},
  };
  return extensions;
}

const std::unordered_map<std::string, std::string> &languages() {
  static const std::unordered_map<std::string, std::string> map = {
      {".py", "python"},  {".js", "javascript"}, {".jsx", "javascript"}, {".ts", "typescript"},
      {".tsx", "typescript"}, {".java", "java"}, {".c", "c"},           {".h", "c"},
      {".cpp", "cpp"},    {".cc", "cpp"},        {".cxx", "cpp"},        {".hpp", "cpp"},
      {".hh", "cpp"},     {".cs", "csharp"},     {".php", "php"},        {".rb", "ruby"},
      {".go", "go"},      {".rs", "rust"},       {".swift", "swift"},    {".kt", "kotlin"},
      {".scala", "scala"}, {".r", "r"},          {".sql", "sql"},        {".html", "html"},
      {".htm", "html"},   {".css", "css"},       {".scss", "scss"},      {".xml", "xml"},
      {".json", "json"},  {".yaml", "yaml"},     {".yml", "yaml"},       {".toml", "toml"},
      {".md", "markdown"}, {".sh", "bash"},      {".bash", "bash"},      {".vue", "vue"},
  };
  return map;
}

FileType sniff_content(const std::filesystem::path &path) {
  std::error_code ec;
  const auto size = std::filesystem::file_size(path, ec);
  if (ec || size >= kSniffLimitBytes) {
    return FileType::Unknown;
  }

  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return FileType::Unknown;
  }
  std::array<char, kSniffSampleBytes> sample{};
  in.read(sample.data(), static_cast<std::streamsize>(sample.size()));
  const auto got = static_cast<std::size_t>(in.gcount());
  for (std::size_t i = 0; i < got; ++i) {
    if (sample[i] == '\0') {
      return FileType::Binary;
    }
  }
  return FileType::Text;
}

} // namespace

std::string_view file_type_name(const FileType type) {
  switch (type) {
  case FileType::SourceCode:
    return "source_code";
  case FileType::Text:
    return "text";
  case FileType::Binary:
    return "binary";
  case FileType::Image:
    return "image";
  case FileType::Document:
    return "document";
  case FileType::Archive:
    return "archive";
  case FileType::Unknown:
    return "unknown";
  }
  return "unknown";
}

bool is_source_extension(const std::string &extension) {
  return source_extensions().contains(extension);
}

std::optional<std::string> language_for(const std::filesystem::path &path) {
  const auto it = languages().find(common::to_lower(path.extension().string()));
  if (it == languages().end()) {
    return std::nullopt;
  }
  return it->second;
}

FileType detect_file_type(const std::filesystem::path &path) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    return FileType::Unknown;
  }

  const std::string extension = common::to_lower(path.extension().string());
  if (is_source_extension(extension)) {
    return FileType::SourceCode;
  }
  if (const auto it = typed_extensions().find(extension); it != typed_extensions().end()) {
    return it->second;
  }
  return sniff_content(path);
}

} // namespace gardener::discovery
