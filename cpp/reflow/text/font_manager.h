#ifndef REFLOW_TEXT_FONT_MANAGER_H
#define REFLOW_TEXT_FONT_MANAGER_H

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

// Forward declarations for FreeType/HarfBuzz
typedef struct FT_LibraryRec_* FT_Library;
typedef struct FT_FaceRec_* FT_Face;
typedef struct hb_font_t hb_font_t;

namespace reflow::text {

// Font metrics in font units, or scaled to a size by getScaledMetrics
struct FontMetrics {
    float unitsPerEM;
    float ascender;             // Positive, above baseline
    float descender;            // Negative, below baseline
    float lineGap;
};

/**
 * FontHandle: Wrapper for a loaded font with FreeType face and HarfBuzz font.
 */
struct FontHandle {
    std::uint32_t id;
    std::string familyName;

    FT_Face ftFace;
    hb_font_t* hbFont;

    FontMetrics metrics;

    // Font data storage (kept alive while face is loaded)
    std::vector<std::uint8_t> fontData;
};

/**
 * FontManager: Loads fonts for measurement and owns the FreeType library.
 */
class FontManager {
public:
    FontManager();
    ~FontManager();

    // Non-copyable
    FontManager(const FontManager&) = delete;
    FontManager& operator=(const FontManager&) = delete;

    /**
     * Initialize FreeType. Must be called before loading fonts.
     * @return True if initialization succeeded
     */
    bool initialize();

    /**
     * Release all fonts and the FreeType library.
     */
    void shutdown();

    bool isInitialized() const { return initialized_; }

    /**
     * Load a font from memory.
     * @param fontData Raw TTF/OTF data (copied and owned by FontManager)
     * @param dataSize Size of font data in bytes
     * @param familyName Optional family name override
     * @return Font ID, or 0 on failure
     */
    std::uint32_t loadFontFromMemory(
        const std::uint8_t* fontData,
        std::size_t dataSize,
        const std::string& familyName = ""
    );

    /**
     * Load a font from a file path.
     * @return Font ID, or 0 on failure
     */
    std::uint32_t loadFontFromFile(const std::string& filePath);

    bool unloadFont(std::uint32_t fontId);

    /**
     * Get a font handle by ID (0 = default font).
     */
    const FontHandle* getFont(std::uint32_t fontId) const;

    bool hasFont(std::uint32_t fontId) const;

    std::uint32_t getDefaultFontId() const { return defaultFontId_; }

    /**
     * Make a loaded font the one resolved by ID 0.
     * @return False if the font is not loaded
     */
    bool setDefaultFontId(std::uint32_t fontId);

    /**
     * Set the size used by FreeType and the HarfBuzz font scale.
     * @param fontSize Size in layout units
     * @return True if successful
     */
    bool setFontSize(std::uint32_t fontId, float fontSize);

    /**
     * Metrics for a font at a size, or proportional defaults if not loaded.
     */
    FontMetrics getScaledMetrics(std::uint32_t fontId, float fontSize) const;

private:
    bool initialized_ = false;
    FT_Library ftLibrary_ = nullptr;

    std::unordered_map<std::uint32_t, std::unique_ptr<FontHandle>> fonts_;

    std::uint32_t nextFontId_ = 1;
    std::uint32_t defaultFontId_ = 0;

    FontHandle* findFont(std::uint32_t fontId) const;
    static void releaseFont(FontHandle& handle);
    static FontMetrics extractMetrics(FT_Face face);
};

} // namespace reflow::text

#endif // REFLOW_TEXT_FONT_MANAGER_H
