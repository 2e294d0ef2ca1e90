#include "reflow/text/font_manager.h"

#include "reflow/core/logging.h"

#include <ft2build.h>
#include FT_FREETYPE_H
#include FT_TRUETYPE_TABLES_H

#include <hb.h>
#include <hb-ft.h>

#include <fstream>

namespace reflow::text {

FontManager::FontManager() = default;

FontManager::~FontManager() {
    shutdown();
}

bool FontManager::initialize() {
    if (initialized_) {
        return true;
    }

    FT_Error error = FT_Init_FreeType(&ftLibrary_);
    if (error) {
        REFLOW_LOG_WARN("FT_Init_FreeType failed: %d", static_cast<int>(error));
        return false;
    }

    initialized_ = true;
    return true;
}

void FontManager::shutdown() {
    if (!initialized_) {
        return;
    }

    for (auto& [id, handle] : fonts_) {
        if (handle) releaseFont(*handle);
    }
    fonts_.clear();
    defaultFontId_ = 0;

    if (ftLibrary_) {
        FT_Done_FreeType(ftLibrary_);
        ftLibrary_ = nullptr;
    }

    initialized_ = false;
}

std::uint32_t FontManager::loadFontFromMemory(
    const std::uint8_t* fontData,
    std::size_t dataSize,
    const std::string& familyName
) {
    if (!initialized_ || !fontData || dataSize == 0) {
        return 0;
    }

    auto handle = std::make_unique<FontHandle>();
    // FreeType reads from this buffer for the lifetime of the face
    handle->fontData.assign(fontData, fontData + dataSize);

    FT_Face face = nullptr;
    FT_Error error = FT_New_Memory_Face(
        ftLibrary_,
        handle->fontData.data(),
        static_cast<FT_Long>(handle->fontData.size()),
        0,  // face index
        &face
    );

    if (error || !face) {
        REFLOW_LOG_DEBUG("FT_New_Memory_Face failed: %d", static_cast<int>(error));
        return 0;
    }

    handle->hbFont = hb_ft_font_create(face, nullptr);
    if (!handle->hbFont) {
        FT_Done_Face(face);
        return 0;
    }

    std::string family = familyName;
    if (family.empty() && face->family_name) {
        family = face->family_name;
    }
    if (family.empty()) {
        family = "Unknown";
    }

    const std::uint32_t fontId = nextFontId_++;
    handle->id = fontId;
    handle->familyName = family;
    handle->ftFace = face;
    handle->metrics = extractMetrics(face);
    fonts_[fontId] = std::move(handle);

    if (defaultFontId_ == 0) {
        defaultFontId_ = fontId;
    }

    return fontId;
}

std::uint32_t FontManager::loadFontFromFile(const std::string& filePath) {
    if (!initialized_) {
        return 0;
    }

    std::ifstream file(filePath, std::ios::binary | std::ios::ate);
    if (!file.is_open()) {
        return 0;
    }

    std::streamsize size = file.tellg();
    if (size <= 0) {
        return 0;
    }
    file.seekg(0, std::ios::beg);

    std::vector<std::uint8_t> buffer(static_cast<std::size_t>(size));
    if (!file.read(reinterpret_cast<char*>(buffer.data()), size)) {
        return 0;
    }

    return loadFontFromMemory(buffer.data(), buffer.size());
}

bool FontManager::unloadFont(std::uint32_t fontId) {
    auto it = fonts_.find(fontId);
    if (it == fonts_.end()) {
        return false;
    }

    if (it->second) releaseFont(*it->second);
    fonts_.erase(it);

    if (defaultFontId_ == fontId) {
        defaultFontId_ = fonts_.empty() ? 0 : fonts_.begin()->first;
    }

    return true;
}

const FontHandle* FontManager::getFont(std::uint32_t fontId) const {
    return findFont(fontId);
}

bool FontManager::hasFont(std::uint32_t fontId) const {
    return findFont(fontId) != nullptr;
}

bool FontManager::setDefaultFontId(std::uint32_t fontId) {
    if (fontId == 0 || fonts_.find(fontId) == fonts_.end()) {
        REFLOW_LOG_WARN("setDefaultFontId: font %u not loaded", fontId);
        return false;
    }
    defaultFontId_ = fontId;
    return true;
}

bool FontManager::setFontSize(std::uint32_t fontId, float fontSize) {
    FontHandle* handle = findFont(fontId);
    if (!handle || !handle->ftFace || fontSize <= 0.0f) {
        return false;
    }

    // 26.6 fixed point at 72 DPI so one point equals one layout unit
    FT_Error error = FT_Set_Char_Size(
        handle->ftFace,
        0,
        static_cast<FT_F26Dot6>(fontSize * 64),
        72,
        72
    );

    if (error) {
        return false;
    }

    if (handle->hbFont) {
        hb_font_set_scale(
            handle->hbFont,
            static_cast<int>(fontSize * 64),
            static_cast<int>(fontSize * 64)
        );
    }

    return true;
}

FontMetrics FontManager::getScaledMetrics(std::uint32_t fontId, float fontSize) const {
    const FontHandle* handle = findFont(fontId);
    if (!handle || handle->metrics.unitsPerEM <= 0.0f) {
        FontMetrics defaults{};
        defaults.unitsPerEM = 1000.0f;
        defaults.ascender = fontSize * 0.8f;
        defaults.descender = fontSize * -0.2f;
        defaults.lineGap = fontSize * 0.1f;
        return defaults;
    }

    const float scale = fontSize / handle->metrics.unitsPerEM;

    FontMetrics scaled{};
    scaled.unitsPerEM = handle->metrics.unitsPerEM;
    scaled.ascender = handle->metrics.ascender * scale;
    scaled.descender = handle->metrics.descender * scale;
    scaled.lineGap = handle->metrics.lineGap * scale;
    return scaled;
}

FontHandle* FontManager::findFont(std::uint32_t fontId) const {
    const std::uint32_t actualId = (fontId == 0) ? defaultFontId_ : fontId;
    auto it = fonts_.find(actualId);
    return (it != fonts_.end()) ? it->second.get() : nullptr;
}

void FontManager::releaseFont(FontHandle& handle) {
    if (handle.hbFont) {
        hb_font_destroy(handle.hbFont);
        handle.hbFont = nullptr;
    }
    if (handle.ftFace) {
        FT_Done_Face(handle.ftFace);
        handle.ftFace = nullptr;
    }
}

FontMetrics FontManager::extractMetrics(FT_Face face) {
    FontMetrics metrics{};
    metrics.unitsPerEM = static_cast<float>(face->units_per_EM);
    metrics.ascender = static_cast<float>(face->ascender);
    metrics.descender = static_cast<float>(face->descender);
    metrics.lineGap = static_cast<float>(face->height - face->ascender + face->descender);

    TT_OS2* os2 = static_cast<TT_OS2*>(FT_Get_Sfnt_Table(face, FT_SFNT_OS2));
    if (os2 && (os2->sTypoAscender != 0 || os2->sTypoDescender != 0)) {
        metrics.ascender = static_cast<float>(os2->sTypoAscender);
        metrics.descender = static_cast<float>(os2->sTypoDescender);
        metrics.lineGap = static_cast<float>(os2->sTypoLineGap);
    }

    return metrics;
}

} // namespace reflow::text
