#include "JapanesePatterns.hpp"
#include "Validators.hpp"

namespace detection
{

namespace
{

// Open repetitions carry an upper bound. std::regex backtracks recursively,
// so an unbounded run over a long token exhausts the stack.

// Katakana, long vowel mark and CJK unified ideographs (U+4E00-U+9FAF)
#define SHIELDAI_KANA_KANJI L"ァ-ヶー一-龯"
// Hiragana added for name stems
#define SHIELDAI_NAME_CHARS L"ぁ-んァ-ヶー一-龯"

PatternRecognizer phoneRecognizer()
{
    return PatternRecognizer("JapanesePhoneRecognizer", EntityType::JpPhoneNumber,
                             {
                                 { "JP_PHONE_LANDLINE", LR"re(0\d{1,4}-?\d{1,4}-?\d{4})re", 0.7 },
                                 { "JP_PHONE_MOBILE", LR"re(0[789]0-?\d{4}-?\d{4})re", 0.85 },
                                 { "JP_PHONE_TOLL_FREE", LR"re(0120-?\d{3}-?\d{3})re", 0.9 },
                             });
}

PatternRecognizer postalCodeRecognizer()
{
    return PatternRecognizer("JapanesePostalCodeRecognizer", EntityType::JpPostalCode,
                             {
                                 { "JP_POSTAL_CODE", LR"re(〒?\d{3}-?\d{4})re", 0.9 },
                             });
}

PatternRecognizer addressRecognizer()
{
    // Prefecture, municipality, then the nearest block or lot number
    return PatternRecognizer(
        "JapaneseAddressRecognizer", EntityType::JpAddress,
        {
            { "JP_ADDRESS", LR"re((東京都|北海道|(?:京都|大阪)府|[\s\S]{2,3}県)[\s\S]{1,4}[市区町村][\s\S]{1,64}?(\d{1,6}[-−]\d{1,6}|\d{1,6}番地?))re", 0.6 },
        });
}

PatternRecognizer myNumberRecognizer()
{
    return PatternRecognizer("JapaneseMyNumberRecognizer", EntityType::JpMyNumber,
                             {
                                 { "JP_MY_NUMBER", LR"re(\d{4}[-\s]?\d{4}[-\s]?\d{4})re", 0.7 },
                             });
}

PatternRecognizer currencyRecognizer()
{
    return PatternRecognizer("JapaneseCurrencyRecognizer", EntityType::JpCurrency,
                             {
                                 { "JP_CURRENCY", LR"re([¥￥]\s?[\d,]{1,32})re", 0.8 },
                                 { "JP_CURRENCY_KANJI", LR"re(\d[\d,]{0,31}\s?[万億兆]?円)re", 0.7 },
                             });
}

PatternRecognizer companyRecognizer()
{
    return PatternRecognizer("JapaneseCompanyRecognizer", EntityType::JpCompany,
                             {
                                 { "JP_COMPANY_KABUSHIKI_PRE", L"株式会社[" SHIELDAI_KANA_KANJI L"A-Za-z0-9]{1,20}", 0.75 },
                                 { "JP_COMPANY_KABUSHIKI_POST", L"[" SHIELDAI_KANA_KANJI L"A-Za-z0-9]{1,20}株式会社", 0.75 },
                                 { "JP_COMPANY_YUGEN_PRE", L"有限会社[" SHIELDAI_KANA_KANJI L"A-Za-z0-9]{1,20}", 0.75 },
                                 { "JP_COMPANY_YUGEN_POST", L"[" SHIELDAI_KANA_KANJI L"A-Za-z0-9]{1,20}有限会社", 0.75 },
                                 { "JP_COMPANY_GODO", L"合同会社[" SHIELDAI_KANA_KANJI L"A-Za-z0-9]{1,20}", 0.75 },
                                 { "JP_COMPANY_INC", LR"re([A-Za-z0-9]{2,20}\s?Inc\.?)re", 0.6 },
                                 { "JP_COMPANY_CORP", LR"re([A-Za-z0-9]{2,20}\s?Corp\.?)re", 0.6 },
                                 { "JP_COMPANY_LLC", LR"re([A-Za-z0-9]{2,20}\s?LLC)re", 0.6 },
                             });
}

PatternRecognizer honorificNameRecognizer()
{
    PatternRecognizer recognizer("JapaneseHonorificNameRecognizer", EntityType::JpPersonName,
                                 {
                                     { "JP_NAME_SAMA", L"[" SHIELDAI_NAME_CHARS L"]{1,6}様", 0.6 },
                                     { "JP_NAME_SAN", L"[" SHIELDAI_NAME_CHARS L"]{1,6}さん", 0.6 },
                                     { "JP_NAME_SHI", L"[" SHIELDAI_NAME_CHARS L"]{1,6}氏", 0.6 },
                                     { "JP_NAME_DONO", L"[" SHIELDAI_NAME_CHARS L"]{1,6}殿", 0.6 },
                                 });
    recognizer.setDenyList(honorificDenyList());
    return recognizer;
}

PatternRecognizer apiKeyRecognizer()
{
    return PatternRecognizer(
        "APIKeyRecognizer", EntityType::ApiKey,
        {
            { "OPENAI_API_KEY", LR"re(sk-[a-zA-Z0-9]{20,256})re", 0.95 },
            { "AWS_ACCESS_KEY", LR"re(AKIA[0-9A-Z]{16})re", 0.95 },
            { "GENERIC_API_KEY",
              LR"re((?:api[-_]?key|apikey|access[-_]?token)['"]?\s{0,8}[:=]\s{0,8}['"]?([-_a-zA-Z0-9]{20,256}))re", 0.7 },
        });
}

#undef SHIELDAI_KANA_KANJI
#undef SHIELDAI_NAME_CHARS

} // namespace

std::vector<PatternRecognizer> createJapaneseRecognizers()
{
    std::vector<PatternRecognizer> recognizers;
    recognizers.push_back(phoneRecognizer());
    recognizers.push_back(postalCodeRecognizer());
    recognizers.push_back(addressRecognizer());
    recognizers.push_back(myNumberRecognizer());
    recognizers.push_back(currencyRecognizer());
    recognizers.push_back(companyRecognizer());
    recognizers.push_back(honorificNameRecognizer());
    recognizers.push_back(apiKeyRecognizer());
    return recognizers;
}

std::vector<PatternRecognizer> createGenericRecognizers()
{
    std::vector<PatternRecognizer> recognizers;

    recognizers.emplace_back(
        "EmailRecognizer", EntityType::EmailAddress,
        std::vector<PatternDefinition>{
            { "EMAIL_ADDRESS", LR"re([-A-Za-z0-9._%+]{1,64}@[-A-Za-z0-9]{1,63}(?:\.[-A-Za-z0-9]{1,63}){0,8}\.[A-Za-z]{2,24})re", 1.0 },
        });

    recognizers.emplace_back(
        "CreditCardRecognizer", EntityType::CreditCard,
        std::vector<PatternDefinition>{
            { "CREDIT_CARD", LR"re(\d{4}[- ]?\d{4}[- ]?\d{4}[- ]?\d{4})re", 0.8 },
        });
    recognizers.back().setValidator(validators::passesLuhn);

    recognizers.emplace_back(
        "IpRecognizer", EntityType::IpAddress,
        std::vector<PatternDefinition>{
            { "IP_ADDRESS", LR"re(\d{1,3}\.\d{1,3}\.\d{1,3}\.\d{1,3})re", 0.7 },
        });
    recognizers.back().setValidator(validators::isValidIpv4);

    recognizers.emplace_back(
        "UrlRecognizer", EntityType::Url,
        std::vector<PatternDefinition>{
            { "URL", LR"re(https?://[^\s<>"'「」（）]{1,2048})re", 0.6 },
        });

    return recognizers;
}

const std::unordered_set<std::wstring>& honorificDenyList()
{
    static const std::unordered_set<std::wstring> kDenyList = {
        L"お客様", L"皆様", L"各位", L"担当者様", L"御担当者様", L"ご担当者様",
        L"関係者様", L"責任者様", L"代表者様", L"管理者様", L"窓口様",
        L"御中", L"貴社様", L"弊社", L"当社", L"御社",
        L"皆さん", L"皆さま", L"みなさま", L"あなた様",
        L"お客さん", L"お客さま", L"先生", L"先輩", L"後輩",
        L"部長", L"課長", L"係長", L"社長", L"会長", L"専務", L"常務", L"取締役",
    };
    return kDenyList;
}

} // namespace detection
