#pragma once
#include <string>

namespace mime {
    const std::string unknown     = "application/octet-stream";
    const std::string jpeg        = "image/jpeg";
    const std::string png         = "image/png";
    const std::string gif         = "image/gif";
    const std::string webp        = "image/webp";
    const std::string tiff        = "image/tiff";
    const std::string bmp         = "image/bmp";
    const std::string svg         = "image/svg+xml";
    const std::string pdf         = "application/pdf";
    const std::string zip         = "application/zip";
    const std::string gzip        = "application/gzip";
    const std::string bzip2       = "application/x-bzip2";
    const std::string xz          = "application/x-xz";
    const std::string tar         = "application/x-tar";
    const std::string rar         = "application/x-rar-compressed";
    const std::string sevenZip    = "application/x-7z-compressed";
    const std::string jar         = "application/java-archive";
    const std::string msword      = "application/msword";
    const std::string docx        = "application/vnd.openxmlformats-officedocument.wordprocessingml.document";
    const std::string xlsx        = "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet";
    const std::string pptx        = "application/vnd.openxmlformats-officedocument.presentationml.presentation";
    const std::string textPlain   = "text/plain";
    const std::string textXml     = "text/xml";
    const std::string textHtml    = "text/html";
}

bool isOfficeOpenXml(const std::string& mediaType);
bool isArchiveType(const std::string& mediaType);
// Formats stored as a ZIP archive: zip itself, OOXML, OpenDocument, JAR.
bool isZipContainer(const std::string& mediaType);
bool isRasterImage(const std::string& mediaType);
